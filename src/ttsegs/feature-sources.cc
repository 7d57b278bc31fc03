// ttsegs/feature-sources.cc

// Copyright 2021  ttsegs contributors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include <algorithm>
#include <cmath>
#include <vector>

#include "feat/wave-reader.h"
#include "ttsegs/feature-cache.h"
#include "ttsegs/feature-sources.h"

namespace ttsegs {

void WaveDataLoader::Load(const std::string &path, Vector<BaseFloat> *samples,
                          BaseFloat *samp_freq) const {
  kaldi::Input ki(path);
  kaldi::WaveData wave;
  wave.Read(ki.Stream());
  const Matrix<BaseFloat> &data = wave.Data();
  if (data.NumRows() == 0)
    KALDI_ERR << "No audio channels in " << path;
  if (data.NumRows() > 1)
    KALDI_VLOG(2) << path << " has " << data.NumRows()
                  << " channels, using the first one.";
  samples->Resize(data.NumCols(), kaldi::kUndefined);
  samples->CopyFromVec(data.Row(0));
  *samp_freq = wave.SampFreq();
}


FbankSpectrogramExtractor::FbankSpectrogramExtractor(
    const kaldi::FbankOptions &opts): opts_(opts) {
  if (opts_.frame_opts.samp_freq <= 0.0)
    KALDI_ERR << "Invalid sampling rate " << opts_.frame_opts.samp_freq;
}

int32 FbankSpectrogramExtractor::NumChannels() const {
  return opts_.mel_opts.num_bins + (opts_.use_energy ? 1 : 0);
}

void FbankSpectrogramExtractor::Extract(const VectorBase<BaseFloat> &samples,
                                        BaseFloat samp_freq,
                                        Matrix<BaseFloat> *mel) const {
  // Kaldi resamples higher-rate input itself when allowed to
  bool downsample = (samp_freq > opts_.frame_opts.samp_freq &&
                     opts_.frame_opts.allow_downsample);
  if (samp_freq != opts_.frame_opts.samp_freq && !downsample)
    KALDI_ERR << samp_freq << " SR doesn't match target "
              << opts_.frame_opts.samp_freq << " SR";
  kaldi::Fbank fbank(opts_);
  Matrix<BaseFloat> feats;
  fbank.ComputeFeatures(samples, samp_freq, 1.0, &feats);
  // Kaldi features are frames by bins
  mel->Resize(feats.NumCols(), feats.NumRows(), kaldi::kUndefined);
  mel->CopyFromMat(feats, kaldi::kTrans);
}

void SetDefaultMelOptions(kaldi::FbankOptions *opts) {
  kaldi::FrameExtractionOptions &frame = opts->frame_opts;
  frame.samp_freq = 22050.0;
  // Kaldi truncates the shift and length to whole samples
  frame.frame_shift_ms = 256.5 * 1000.0 / 22050.0;
  frame.frame_length_ms = 1024.5 * 1000.0 / 22050.0;
  frame.dither = 0.0;
  frame.preemph_coeff = 0.0;
  frame.remove_dc_offset = false;
  frame.window_type = "hanning";
  frame.snip_edges = false;
  opts->mel_opts.num_bins = 80;
  opts->mel_opts.low_freq = 0.0;
  opts->mel_opts.high_freq = 8000.0;
  opts->use_energy = false;
}

void SetDefaultDownsampledMelOptions(kaldi::FbankOptions *opts) {
  SetDefaultMelOptions(opts);
  kaldi::FrameExtractionOptions &frame = opts->frame_opts;
  frame.samp_freq = 800.0;
  frame.frame_shift_ms = 10.5 * 1000.0 / 800.0;
  frame.frame_length_ms = 40.5 * 1000.0 / 800.0;
  opts->mel_opts.num_bins = 10;
  opts->mel_opts.high_freq = 400.0;
}


void PitchEstimatorOptions::Check() const {
  if (method != "kaldi")
    KALDI_ERR << "Unsupported pitch estimation method '" << method
              << "'; only kaldi is supported.";
  if (norm_method != "default" && norm_method != "utterance")
    KALDI_ERR << "Unknown pitch normalization method '" << norm_method << "'";
  if (pitch_std <= 0.0)
    KALDI_ERR << "--pitch-std must be positive, got " << pitch_std;
}

// One pass of the Kaldi pitch tracker.  Frames whose NCCF is below
// "voicing_threshold" get 0.
static void EstimatePitchPass(const kaldi::PitchExtractionOptions &opts,
                              const VectorBase<BaseFloat> &samples,
                              BaseFloat voicing_threshold,
                              Vector<BaseFloat> *f0) {
  Matrix<BaseFloat> nccf_pitch;
  kaldi::ComputeKaldiPitch(opts, samples, &nccf_pitch);
  f0->Resize(nccf_pitch.NumRows());
  for (int32 t = 0; t < nccf_pitch.NumRows(); t++)
    if (nccf_pitch(t, 0) >= voicing_threshold)
      (*f0)(t) = nccf_pitch(t, 1);
}

static void VoicedValues(const VectorBase<BaseFloat> &f0,
                         std::vector<BaseFloat> *values) {
  values->clear();
  for (int32 t = 0; t < f0.Dim(); t++)
    if (f0(t) != 0.0) values->push_back(f0(t));
}

void KaldiPitchEstimator::Estimate(const std::string &wav_path,
                                   int32 target_frames,
                                   const PitchEstimatorOptions &opts,
                                   Matrix<BaseFloat> *pitch) const {
  if (target_frames < 1)
    KALDI_ERR << "Cannot estimate pitch for " << target_frames
              << " frames (" << wav_path << ")";
  Vector<BaseFloat> samples;
  BaseFloat samp_freq;
  loader_->Load(wav_path, &samples, &samp_freq);
  kaldi::PitchExtractionOptions extraction_opts = opts.extraction_opts;
  if (samp_freq != extraction_opts.samp_freq)
    KALDI_ERR << samp_freq << " SR of " << wav_path
              << " doesn't match target " << extraction_opts.samp_freq
              << " SR";

  Vector<BaseFloat> f0;
  EstimatePitchPass(extraction_opts, samples, opts.voicing_threshold, &f0);

  if (opts.two_pass) {
    // Narrow the search range to [0.75 q25, 1.5 q75] of the first pass.
    std::vector<BaseFloat> voiced;
    VoicedValues(f0, &voiced);
    if (voiced.size() >= 10) {
      std::sort(voiced.begin(), voiced.end());
      BaseFloat q25 = voiced[voiced.size() / 4],
          q75 = voiced[(3 * voiced.size()) / 4];
      BaseFloat min_f0 = std::max(extraction_opts.min_f0,
                                   static_cast<BaseFloat>(0.75 * q25)),
          max_f0 = std::min(extraction_opts.max_f0,
                            static_cast<BaseFloat>(1.5 * q75));
      if (max_f0 > min_f0) {
        extraction_opts.min_f0 = min_f0;
        extraction_opts.max_f0 = max_f0;
        KALDI_VLOG(3) << "Second pitch pass for " << wav_path << " with f0 in ["
                      << min_f0 << ", " << max_f0 << "]";
        EstimatePitchPass(extraction_opts, samples, opts.voicing_threshold,
                          &f0);
      }
    }
  }

  pitch->Resize(1, target_frames);
  int32 n = std::min(target_frames, f0.Dim());
  if (n > 0)
    pitch->Row(0).Range(0, n).CopyFromVec(f0.Range(0, n));
  if (opts.pitch_norm)
    NormalizePitch(opts.norm_method, opts.pitch_mean, opts.pitch_std, pitch);
}

void NormalizePitch(const std::string &norm_method, BaseFloat mean,
                    BaseFloat std_dev, MatrixBase<BaseFloat> *pitch) {
  if (norm_method == "utterance") {
    double sum = 0.0, sumsq = 0.0;
    int64 count = 0;
    for (int32 r = 0; r < pitch->NumRows(); r++) {
      for (int32 c = 0; c < pitch->NumCols(); c++) {
        BaseFloat f = (*pitch)(r, c);
        if (f == 0.0) continue;
        sum += f;
        sumsq += f * f;
        count++;
      }
    }
    if (count < 2) return;
    mean = sum / count;
    double var = sumsq / count - mean * mean;
    std_dev = (var > 0.0 ? std::sqrt(var) : 1.0);
  } else if (norm_method != "default") {
    KALDI_ERR << "Unknown pitch normalization method '" << norm_method << "'";
  }
  KALDI_ASSERT(std_dev > 0.0);
  for (int32 r = 0; r < pitch->NumRows(); r++)
    for (int32 c = 0; c < pitch->NumCols(); c++)
      if ((*pitch)(r, c) != 0.0)
        (*pitch)(r, c) = ((*pitch)(r, c) - mean) / std_dev;
}

void ComputeFrameEnergy(const MatrixBase<BaseFloat> &mel,
                        Vector<BaseFloat> *energy) {
  energy->Resize(mel.NumCols());
  for (int32 r = 0; r < mel.NumRows(); r++)
    for (int32 c = 0; c < mel.NumCols(); c++)
      (*energy)(c) += mel(r, c) * mel(r, c);
  energy->ApplyPow(0.5);
}

std::string WavPathForMel(const std::string &mel_path) {
  const std::string wav_ext(".wav");
  if (mel_path.size() >= wav_ext.size() &&
      mel_path.compare(mel_path.size() - wav_ext.size(), wav_ext.size(),
                       wav_ext) == 0)
    return mel_path;
  std::string path(mel_path);
  const std::string from("/mels/"), to("/wavs/");
  size_t pos = 0;
  while ((pos = path.find(from, pos)) != std::string::npos) {
    path.replace(pos, from.size(), to);
    pos += to.size();
  }
  return ReplaceExtension(path, wav_ext);
}

}  // namespace ttsegs
