// ttsegs/feature-sources.h

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

#ifndef TTSEGS_TTSEGS_FEATURE_SOURCES_H_
#define TTSEGS_TTSEGS_FEATURE_SOURCES_H_

#include <string>

#include "ttsegs/ttsegs-common.h"
#include "feat/feature-fbank.h"
#include "feat/pitch-functions.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

/// Reads a waveform.  Multi-channel audio is reduced to its first channel.
class WaveformLoader {
 public:
  virtual void Load(const std::string &path, Vector<BaseFloat> *samples,
                    BaseFloat *samp_freq) const = 0;
  virtual ~WaveformLoader() { }
};

/// Reads RIFF wave files with kaldi::WaveData.  Samples keep the integer
/// scale of the file, as everywhere in Kaldi.
class WaveDataLoader: public WaveformLoader {
 public:
  virtual void Load(const std::string &path, Vector<BaseFloat> *samples,
                    BaseFloat *samp_freq) const;
};


/// Turns a waveform into a mel-spectrogram laid out channels by frames.
class SpectrogramExtractor {
 public:
  virtual void Extract(const VectorBase<BaseFloat> &samples,
                       BaseFloat samp_freq,
                       Matrix<BaseFloat> *mel) const = 0;
  /// The only sampling rate accepted by Extract().
  virtual BaseFloat SampFreq() const = 0;
  virtual int32 NumChannels() const = 0;
  virtual ~SpectrogramExtractor() { }
};

/// Log mel filterbank energies computed by kaldi::Fbank.
class FbankSpectrogramExtractor: public SpectrogramExtractor {
 public:
  explicit FbankSpectrogramExtractor(const kaldi::FbankOptions &opts);

  /// Throws if samp_freq differs from the configured rate, unless it is
  /// higher and the options allow downsampling.
  virtual void Extract(const VectorBase<BaseFloat> &samples,
                       BaseFloat samp_freq,
                       Matrix<BaseFloat> *mel) const;
  virtual BaseFloat SampFreq() const { return opts_.frame_opts.samp_freq; }
  virtual int32 NumChannels() const;

 private:
  kaldi::FbankOptions opts_;
};

/// Fbank settings of the primary mel-spectrogram: 22.05 kHz audio, 256
/// sample hop, 1024 sample Hann window, 80 bins up to 8 kHz, no dither.
void SetDefaultMelOptions(kaldi::FbankOptions *opts);

/// Fbank settings of the downsampled mel-spectrogram: 800 Hz audio, 10
/// sample hop, 40 sample window, bins up to 400 Hz; audio at higher rates is
/// downsampled.  With a 64 point FFT only a few mel bins can be non-empty,
/// hence the small bin count.
void SetDefaultDownsampledMelOptions(kaldi::FbankOptions *opts);


struct PitchEstimatorOptions {
  std::string method;
  bool two_pass;
  std::string norm_method;
  bool pitch_norm;
  BaseFloat pitch_mean;
  BaseFloat pitch_std;
  BaseFloat voicing_threshold;
  kaldi::PitchExtractionOptions extraction_opts;

  PitchEstimatorOptions(): method("kaldi"), two_pass(false),
                           norm_method("default"), pitch_norm(true),
                           pitch_mean(214.72203), pitch_std(65.72038),
                           voicing_threshold(0.3) {
    // frames aligned with the default mel-spectrogram: the tracker works at
    // resample_freq, where a 256 sample hop at 22050Hz is exactly 48 samples
    extraction_opts.samp_freq = 22050.0;
    extraction_opts.resample_freq = 22050.0 * 48.0 / 256.0;
    extraction_opts.frame_shift_ms = 256.5 * 1000.0 / 22050.0;
    extraction_opts.snip_edges = false;
  }

  void Register(OptionsItf *opts) {
    opts->Register("pitch-online-method", &method,
                   "Pitch estimation method; only \"kaldi\" is supported.");
    opts->Register("two-pass-method", &two_pass,
                   "If true, estimate pitch twice, restricting the second pass "
                   "to a range derived from the quartiles of the first.");
    opts->Register("pitch-norm-method", &norm_method,
                   "\"default\" normalizes voiced frames with --pitch-mean and "
                   "--pitch-std, \"utterance\" with the statistics of the "
                   "utterance.");
    opts->Register("pitch-norm", &pitch_norm,
                   "If true, normalize estimated pitch.");
    opts->Register("pitch-mean", &pitch_mean, "Pitch mean (Hz).");
    opts->Register("pitch-std", &pitch_std, "Pitch standard deviation (Hz).");
    opts->Register("pitch-voicing-threshold", &voicing_threshold,
                   "Frames whose NCCF is below this value are unvoiced and "
                   "get pitch 0.");
    // shares option names with the Fbank options, hence the prefix
    kaldi::ParseOptions pitch_po("pitch", opts);
    extraction_opts.Register(&pitch_po);
  }

  /// Throws on unsupported methods or invalid values.
  void Check() const;
};

/// Estimates a pitch contour from a waveform file.
class PitchEstimator {
 public:
  /// Outputs a 1 by target_frames matrix of pitch values (Hz, or normalized
  /// if opts.pitch_norm); unvoiced frames are 0.  The estimate is truncated
  /// or zero-padded to target_frames.
  virtual void Estimate(const std::string &wav_path, int32 target_frames,
                        const PitchEstimatorOptions &opts,
                        Matrix<BaseFloat> *pitch) const = 0;
  virtual ~PitchEstimator() { }
};

/// Pitch from kaldi::ComputeKaldiPitch.
class KaldiPitchEstimator: public PitchEstimator {
 public:
  /// Does not take ownership of "loader".
  explicit KaldiPitchEstimator(const WaveformLoader *loader):
      loader_(loader) { }

  virtual void Estimate(const std::string &wav_path, int32 target_frames,
                        const PitchEstimatorOptions &opts,
                        Matrix<BaseFloat> *pitch) const;

 private:
  const WaveformLoader *loader_;
};

/// Normalizes the nonzero (voiced) entries of "pitch" in place as
/// (f - mean) / std; unvoiced entries stay 0.  For "utterance" the mean and
/// standard deviation of the voiced entries are used instead of the given
/// ones.
void NormalizePitch(const std::string &norm_method, BaseFloat mean,
                    BaseFloat std_dev, MatrixBase<BaseFloat> *pitch);

/// Per-frame L2 norm of the mel-spectrogram over its channel axis (the rows);
/// "energy" gets one entry per column.
void ComputeFrameEnergy(const MatrixBase<BaseFloat> &mel,
                        Vector<BaseFloat> *energy);

/// Path of the waveform a mel file was computed from: "/mels/" becomes
/// "/wavs/" and the extension becomes ".wav".  Wave paths are returned
/// unchanged.
std::string WavPathForMel(const std::string &mel_path);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_FEATURE_SOURCES_H_
