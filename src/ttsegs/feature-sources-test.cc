// ttsegs/feature-sources-test.cc

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

#include "ttsegs/feature-sources.h"

namespace ttsegs {

static void MakeSine(BaseFloat freq, BaseFloat samp_freq, int32 num_samples,
                     Vector<BaseFloat> *samples) {
  samples->Resize(num_samples);
  for (int32 i = 0; i < num_samples; i++)
    (*samples)(i) = 10000.0 * std::sin(2.0 * M_PI * freq * i / samp_freq);
}

// Returns a 200Hz sine for any path.
class SineWaveformLoader: public WaveformLoader {
 public:
  explicit SineWaveformLoader(BaseFloat samp_freq): samp_freq_(samp_freq) { }
  virtual void Load(const std::string &path, Vector<BaseFloat> *samples,
                    BaseFloat *samp_freq) const {
    MakeSine(200.0, samp_freq_, static_cast<int32>(samp_freq_), samples);
    *samp_freq = samp_freq_;
  }
 private:
  BaseFloat samp_freq_;
};

// 150Hz for the first "step_seconds", 250Hz after that.
class PitchStepWaveformLoader: public WaveformLoader {
 public:
  PitchStepWaveformLoader(BaseFloat step_seconds, BaseFloat total_seconds):
      step_seconds_(step_seconds), total_seconds_(total_seconds) { }
  virtual void Load(const std::string &path, Vector<BaseFloat> *samples,
                    BaseFloat *samp_freq) const {
    *samp_freq = 22050.0;
    int32 num_samples = static_cast<int32>(total_seconds_ * 22050.0);
    samples->Resize(num_samples);
    double phase = 0.0;
    for (int32 i = 0; i < num_samples; i++) {
      double freq = (i < step_seconds_ * 22050.0 ? 150.0 : 250.0);
      phase += 2.0 * M_PI * freq / 22050.0;
      (*samples)(i) = 10000.0 * std::sin(phase);
    }
  }
 private:
  BaseFloat step_seconds_;
  BaseFloat total_seconds_;
};

void UnitTestFrameEnergy() {
  Matrix<BaseFloat> mel(2, 3);
  mel(0, 0) = 3.0;
  mel(1, 0) = 4.0;
  mel(0, 2) = 1.0;
  mel(1, 2) = -1.0;
  Vector<BaseFloat> energy;
  ComputeFrameEnergy(mel, &energy);
  KALDI_ASSERT(energy.Dim() == 3);
  KALDI_ASSERT(kaldi::ApproxEqual(energy(0), 5.0));
  KALDI_ASSERT(energy(1) == 0.0);
  KALDI_ASSERT(kaldi::ApproxEqual(energy(2), std::sqrt(2.0)));
}

void UnitTestNormalizePitch() {
  Matrix<BaseFloat> pitch(1, 3);
  pitch(0, 1) = 100.0;
  pitch(0, 2) = 300.0;
  Matrix<BaseFloat> pitch2(pitch);
  NormalizePitch("default", 200.0, 50.0, &pitch);
  KALDI_ASSERT(pitch(0, 0) == 0.0);
  KALDI_ASSERT(kaldi::ApproxEqual(pitch(0, 1), -2.0));
  KALDI_ASSERT(kaldi::ApproxEqual(pitch(0, 2), 2.0));

  // mean 200, standard deviation 100 over the voiced frames
  NormalizePitch("utterance", 0.0, 1.0, &pitch2);
  KALDI_ASSERT(pitch2(0, 0) == 0.0);
  KALDI_ASSERT(kaldi::ApproxEqual(pitch2(0, 1), -1.0));
  KALDI_ASSERT(kaldi::ApproxEqual(pitch2(0, 2), 1.0));

  bool threw = false;
  try {
    NormalizePitch("global", 0.0, 1.0, &pitch2);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestWavPathForMel() {
  KALDI_ASSERT(WavPathForMel("/d/mels/LJ001-0001.mat") ==
               "/d/wavs/LJ001-0001.wav");
  KALDI_ASSERT(WavPathForMel("/d/wavs/LJ001-0001.wav") ==
               "/d/wavs/LJ001-0001.wav");
  KALDI_ASSERT(WavPathForMel("a.pt") == "a.wav");
}

void UnitTestPitchOptions() {
  PitchEstimatorOptions opts;
  opts.Check();
  opts.method = "pyin";
  bool threw = false;
  try {
    opts.Check();
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestFbankExtractor() {
  kaldi::FbankOptions opts;
  SetDefaultMelOptions(&opts);
  FbankSpectrogramExtractor extractor(opts);
  KALDI_ASSERT(extractor.NumChannels() == 80 &&
               extractor.SampFreq() == 22050.0);
  Vector<BaseFloat> samples;
  MakeSine(440.0, 22050.0, 22050, &samples);
  Matrix<BaseFloat> mel;
  extractor.Extract(samples, 22050.0, &mel);
  // one frame per 256 samples, centered
  KALDI_ASSERT(mel.NumRows() == 80 && mel.NumCols() == 86);

  MakeSine(440.0, 16000.0, 16000, &samples);
  bool threw = false;
  try {
    extractor.Extract(samples, 16000.0, &mel);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);

  kaldi::FbankOptions ds_opts;
  SetDefaultDownsampledMelOptions(&ds_opts);
  FbankSpectrogramExtractor ds_extractor(ds_opts);
  MakeSine(100.0, 800.0, 800, &samples);
  ds_extractor.Extract(samples, 800.0, &mel);
  // one frame per 10 samples
  KALDI_ASSERT(mel.NumRows() == 10 && mel.NumCols() == 80);

  // audio at the primary rate is not resampled unless asked for
  MakeSine(100.0, 22050.0, 22050, &samples);
  threw = false;
  try {
    ds_extractor.Extract(samples, 22050.0, &mel);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
  ds_opts.frame_opts.allow_downsample = true;
  FbankSpectrogramExtractor resampling_extractor(ds_opts);
  resampling_extractor.Extract(samples, 22050.0, &mel);
  KALDI_ASSERT(mel.NumRows() == 10 && mel.NumCols() > 0);
}

void UnitTestKaldiPitchEstimator() {
  SineWaveformLoader loader(22050.0);
  KaldiPitchEstimator estimator(&loader);
  PitchEstimatorOptions opts;
  opts.pitch_norm = false;
  for (int32 two_pass = 0; two_pass <= 1; two_pass++) {
    opts.two_pass = (two_pass != 0);
    Matrix<BaseFloat> pitch;
    estimator.Estimate("utt.wav", 50, opts, &pitch);
    KALDI_ASSERT(pitch.NumRows() == 1 && pitch.NumCols() == 50);
    std::vector<BaseFloat> voiced;
    for (int32 t = 0; t < 50; t++)
      if (pitch(0, t) != 0.0) voiced.push_back(pitch(0, t));
    KALDI_ASSERT(voiced.size() >= 10);
    std::sort(voiced.begin(), voiced.end());
    BaseFloat median = voiced[voiced.size() / 2];
    KALDI_ASSERT(median > 190.0 && median < 210.0);
  }
  // longer than the audio: zero padded
  Matrix<BaseFloat> pitch;
  estimator.Estimate("utt.wav", 500, opts, &pitch);
  KALDI_ASSERT(pitch.NumCols() == 500 && pitch(0, 499) == 0.0);

  bool threw = false;
  try {
    estimator.Estimate("utt.wav", 0, opts, &pitch);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);

  SineWaveformLoader wrong_rate(16000.0);
  KaldiPitchEstimator estimator2(&wrong_rate);
  threw = false;
  try {
    estimator2.Estimate("utt.wav", 50, opts, &pitch);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

// The pitch frames must stay in step with the 256 sample mel hop over long
// utterances; a pitch change at 9 s has to show up at mel frame 9 * 22050 / 256.
void UnitTestPitchFrameAlignment() {
  PitchEstimatorOptions opts;
  opts.pitch_norm = false;
  KALDI_ASSERT(opts.extraction_opts.NccfWindowShift() * 22050.0 ==
               256.0 * opts.extraction_opts.resample_freq);

  PitchStepWaveformLoader loader(9.0, 10.0);
  KaldiPitchEstimator estimator(&loader);
  int32 num_frames = static_cast<int32>((10.0 * 22050 + 128) / 256);
  Matrix<BaseFloat> pitch;
  estimator.Estimate("step.wav", num_frames, opts, &pitch);
  KALDI_ASSERT(pitch.NumCols() == num_frames);
  int32 expected = static_cast<int32>(std::ceil(9.0 * 22050.0 / 256.0)),
      first_high = -1;
  for (int32 t = expected / 2; t < num_frames; t++) {
    if (pitch(0, t) > 200.0) {
      first_high = t;
      break;
    }
  }
  KALDI_LOG << "Pitch step found at frame " << first_high << ", expected "
            << expected;
  KALDI_ASSERT(first_high >= expected - 3 && first_high <= expected + 3);
  // values well after the step are the new pitch
  KALDI_ASSERT(std::abs(pitch(0, expected + 20) - 250.0) < 10.0);
  KALDI_ASSERT(std::abs(pitch(0, expected - 20) - 150.0) < 10.0);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  kaldi::SetVerboseLevel(1);
  UnitTestFrameEnergy();
  UnitTestNormalizePitch();
  UnitTestWavPathForMel();
  UnitTestPitchOptions();
  UnitTestFbankExtractor();
  UnitTestKaldiPitchEstimator();
  UnitTestPitchFrameAlignment();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
