// ttsegs/example-loader-test.cc

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

#include <stdlib.h>
#include <fstream>

#include "ttsegs/example-loader.h"
#include "ttsegs/feature-cache.h"

namespace ttsegs {

// Counts its calls; the pitch is 100 Hz everywhere.
class ConstantPitchEstimator: public PitchEstimator {
 public:
  ConstantPitchEstimator(): num_calls_(0) { }
  virtual void Estimate(const std::string &wav_path, int32 target_frames,
                        const PitchEstimatorOptions &opts,
                        Matrix<BaseFloat> *pitch) const {
    num_calls_++;
    last_path_ = wav_path;
    pitch->Resize(1, target_frames);
    pitch->Set(100.0);
  }
  int32 NumCalls() const { return num_calls_; }
  const std::string &LastPath() const { return last_path_; }
 private:
  mutable int32 num_calls_;
  mutable std::string last_path_;
};

class SilenceWaveformLoader: public WaveformLoader {
 public:
  virtual void Load(const std::string &path, Vector<BaseFloat> *samples,
                    BaseFloat *samp_freq) const {
    samples->Resize(1000);
    *samp_freq = 16000.0;
  }
};

// One frame of all ones per 100 samples.
class OnesExtractor: public SpectrogramExtractor {
 public:
  explicit OnesExtractor(int32 num_channels): num_channels_(num_channels) { }
  virtual void Extract(const VectorBase<BaseFloat> &samples,
                       BaseFloat samp_freq, Matrix<BaseFloat> *mel) const {
    mel->Resize(num_channels_, samples.Dim() / 100);
    mel->Set(1.0);
  }
  virtual BaseFloat SampFreq() const { return 16000.0; }
  virtual int32 NumChannels() const { return num_channels_; }
 private:
  int32 num_channels_;
};

class LoaderTestSetup {
 public:
  LoaderTestSetup(): mel_extractor_(4), ds_mel_extractor_(2) {
    char tmpl[] = "/tmp/example-loader-test.XXXXXX";
    char *dir = mkdtemp(tmpl);
    KALDI_ASSERT(dir != NULL);
    dir_ = dir;
    std::map<std::string, int32> symbols;
    symbols[" "] = 0;
    symbols["a"] = 1;
    symbols["b"] = 2;
    symbols["c"] = 3;
    symbols["d"] = 4;
    encoder_ = new SymbolTableTextEncoder(
        "basic_cleaners", symbols,
        std::map<std::string, std::vector<std::string> >());
    collaborators_.text_encoder = encoder_;
    collaborators_.waveform_loader = &waveform_loader_;
    collaborators_.mel_extractor = &mel_extractor_;
    collaborators_.ds_mel_extractor = &ds_mel_extractor_;
    collaborators_.pitch_estimator = &pitch_estimator_;
    collaborators_.label_upsampler = &label_upsampler_;
  }
  ~LoaderTestSetup() {
    delete encoder_;
    std::string cmd = "rm -r " + dir_;
    if (system(cmd.c_str()) != 0)
      KALDI_WARN << "Could not remove " << dir_;
  }

  const std::string &Dir() const { return dir_; }
  const TtsCollaborators &Collaborators() const { return collaborators_; }
  const ConstantPitchEstimator &Estimator() const { return pitch_estimator_; }

  // Writes a frames by channels mel matrix and returns its path.
  std::string WriteMel(const std::string &name, int32 num_frames,
                       int32 num_channels) {
    Matrix<BaseFloat> feats;
    if (num_frames > 0) {
      feats.Resize(num_frames, num_channels);
      feats.SetRandn();
    }
    std::string path = dir_ + "/mels/" + name + ".mat";
    CreateParentDirectories(path);
    kaldi::WriteKaldiObject(feats, path, true);
    return path;
  }

  std::string WritePitchVector(const std::string &name, int32 num_frames) {
    Vector<BaseFloat> pitch(num_frames);
    pitch.Set(150.0);
    std::string path = dir_ + "/pitch/" + name + ".vec";
    CreateParentDirectories(path);
    kaldi::WriteKaldiObject(pitch, path, true);
    return path;
  }

  std::string WriteWordLabels(const std::string &name,
                              const std::vector<int32> &labels) {
    std::string path = dir_ + "/cwt/" + name + ".ali";
    CreateParentDirectories(path);
    kaldi::Output ko(path, true);
    kaldi::WriteIntegerVector(ko.Stream(), true, labels);
    return path;
  }

 private:
  std::string dir_;
  SymbolTableTextEncoder *encoder_;
  SilenceWaveformLoader waveform_loader_;
  OnesExtractor mel_extractor_;
  OnesExtractor ds_mel_extractor_;
  ConstantPitchEstimator pitch_estimator_;
  RepeatWordLabelUpsampler label_upsampler_;
  TtsCollaborators collaborators_;
};

static bool LoadThrows(const ExampleLoader &loader, int32 index) {
  TtsExample eg;
  try {
    loader.Load(index, &eg);
  } catch (const std::exception &) {
    return true;
  }
  return false;
}

void UnitTestDiskFeatures() {
  LoaderTestSetup setup;
  std::vector<CorpusEntry> entries(2);
  entries[0].mel_path = setup.WriteMel("utt1", 12, 4);
  entries[0].pitch_path = setup.WritePitchVector("utt1", 12);
  entries[0].text = "Ab cd";
  entries[1].mel_path = setup.WriteMel("utt2", 12, 4);
  entries[1].pitch_path = setup.WritePitchVector("utt2", 11);
  entries[1].text = "a";

  TtsDatasetOptions opts;
  opts.dataset_path = setup.Dir();
  ExampleLoader loader(opts, entries, setup.Collaborators());
  KALDI_ASSERT(loader.NumExamples() == 2);
  KALDI_ASSERT(loader.GetMelSource().Type() == "disk");
  KALDI_ASSERT(loader.GetPitchSource().Type() == "disk");
  KALDI_ASSERT(loader.PriorSource().Type() == "interpolated");

  TtsExample eg;
  loader.Load(0, &eg);
  KALDI_ASSERT(eg.TextLength() == 5 && eg.text[2] == 0);
  KALDI_ASSERT(eg.mel.NumRows() == 4 && eg.mel.NumCols() == 12);
  KALDI_ASSERT(eg.pitch.NumRows() == 1 && eg.pitch.NumCols() == 12);
  KALDI_ASSERT(eg.pitch(0, 3) == 150.0);
  KALDI_ASSERT(eg.energy.Dim() == 12);
  KALDI_ASSERT(eg.prior.NumRows() == 12 && eg.prior.NumCols() == 5);
  KALDI_ASSERT(!eg.HasSpeaker() && !eg.has_prosody && !eg.has_ds_mel);
  KALDI_ASSERT(eg.audio_path == entries[0].mel_path);

  Matrix<BaseFloat> feats;
  kaldi::ReadKaldiObject(entries[0].mel_path, &feats);
  KALDI_ASSERT(kaldi::ApproxEqual(feats(7, 2), eg.mel(2, 7)));
  Vector<BaseFloat> energy;
  ComputeFrameEnergy(eg.mel, &energy);
  KALDI_ASSERT(energy.ApproxEqual(eg.energy, 1.0e-05));

  // pitch and mel lengths differ
  KALDI_ASSERT(LoadThrows(loader, 1));
  KALDI_ASSERT(LoadThrows(loader, 2));
  KALDI_ASSERT(LoadThrows(loader, -1));
}

void UnitTestEstimatedPitch() {
  LoaderTestSetup setup;
  std::vector<CorpusEntry> entries(1);
  entries[0].mel_path = setup.WriteMel("utt1", 9, 4);
  entries[0].text = "abc";

  TtsDatasetOptions opts;
  opts.dataset_path = setup.Dir();
  opts.load_pitch_from_disk = false;
  opts.pitch_online_dir = setup.Dir() + "/pitch_cache";
  {
    ExampleLoader loader(opts, entries, setup.Collaborators());
    KALDI_ASSERT(loader.GetPitchSource().Type() == "cached");
    TtsExample eg;
    loader.Load(0, &eg);
    KALDI_ASSERT(eg.pitch.NumCols() == 9 && eg.pitch(0, 0) == 100.0);
    KALDI_ASSERT(setup.Estimator().NumCalls() == 1);
    KALDI_ASSERT(setup.Estimator().LastPath() ==
                 setup.Dir() + "/wavs/utt1.wav");
    KALDI_ASSERT(CacheFileExists(setup.Dir() + "/pitch_cache/mels/utt1.mat"));
    loader.Load(0, &eg);
    KALDI_ASSERT(setup.Estimator().NumCalls() == 1);
    KALDI_ASSERT(eg.pitch.NumCols() == 9 && eg.pitch(0, 8) == 100.0);
  }

  opts.pitch_online_dir = "";
  entries.push_back(entries[0]);
  entries[1].mel_path = setup.WriteMel("empty", 0, 4);
  ExampleLoader loader(opts, entries, setup.Collaborators());
  KALDI_ASSERT(loader.GetPitchSource().Type() == "computed");
  TtsExample eg;
  loader.Load(0, &eg);
  KALDI_ASSERT(setup.Estimator().NumCalls() == 2);
  // a mel without frames fails before any pitch is estimated
  KALDI_ASSERT(LoadThrows(loader, 1));
  KALDI_ASSERT(setup.Estimator().NumCalls() == 2);

  // caching needs estimated pitch
  opts.load_pitch_from_disk = true;
  opts.pitch_online_dir = setup.Dir() + "/pitch_cache";
  bool threw = false;
  try {
    ExampleLoader bad_loader(opts, entries, setup.Collaborators());
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestComputedMels() {
  LoaderTestSetup setup;
  std::vector<CorpusEntry> entries(1);
  entries[0].mel_path = setup.Dir() + "/wavs/utt1.wav";
  entries[0].ds_mel_path = setup.Dir() + "/wavs/utt1.wav";
  entries[0].text = "ab";

  TtsDatasetOptions opts;
  opts.load_mel_from_disk = false;
  opts.load_pitch_from_disk = false;
  opts.mels_downsampled = true;
  opts.load_ds_mel_from_disk = false;
  ExampleLoader loader(opts, entries, setup.Collaborators());
  KALDI_ASSERT(loader.GetMelSource().Type() == "computed");
  TtsExample eg;
  loader.Load(0, &eg);
  KALDI_ASSERT(eg.mel.NumRows() == 4 && eg.mel.NumCols() == 10);
  KALDI_ASSERT(eg.has_ds_mel && eg.ds_mel.NumRows() == 2 &&
               eg.ds_mel.NumCols() == 10);
  KALDI_ASSERT(eg.pitch.NumCols() == 10);
  KALDI_ASSERT(kaldi::ApproxEqual(eg.energy(0), 2.0));
}

void UnitTestSpacesAndProsody() {
  LoaderTestSetup setup;
  std::vector<int32> labels;
  labels.push_back(2);
  labels.push_back(1);
  std::vector<CorpusEntry> entries(2);
  entries[0].mel_path = setup.WriteMel("utt1", 6, 4);
  entries[0].pitch_path = setup.WritePitchVector("utt1", 6);
  entries[0].cwt_path = setup.WriteWordLabels("utt1", labels);
  entries[0].text = "ab cd";
  entries[1] = entries[0];
  entries[1].text = "ab cd a";

  TtsDatasetOptions opts;
  opts.cwt_accent = true;
  opts.prepend_space_to_text = true;
  opts.append_space_to_text = true;
  ExampleLoader loader(opts, entries, setup.Collaborators());
  TtsExample eg;
  loader.Load(0, &eg);
  int32 text[] = { 0, 1, 2, 0, 3, 4, 0 };
  int32 prosody[] = { 0, 2, 2, 2, 1, 1, 0 };
  KALDI_ASSERT(eg.TextLength() == 7 && eg.has_prosody);
  for (int32 i = 0; i < 7; i++)
    KALDI_ASSERT(eg.text[i] == text[i] && eg.prosody[i] == prosody[i]);
  KALDI_ASSERT(eg.prior.NumCols() == 7);

  // three words but two labels
  KALDI_ASSERT(LoadThrows(loader, 1));
}

void UnitTestSpeakers() {
  LoaderTestSetup setup;
  std::vector<CorpusEntry> entries(2);
  entries[0].mel_path = setup.WriteMel("utt1", 5, 4);
  entries[0].pitch_path = setup.WritePitchVector("utt1", 5);
  entries[0].text = "abc";
  entries[0].speaker = 1;
  entries[1] = entries[0];
  entries[1].speaker = 2;

  TtsDatasetOptions opts;
  opts.n_speakers = 2;
  ExampleLoader loader(opts, entries, setup.Collaborators());
  TtsExample eg;
  loader.Load(0, &eg);
  KALDI_ASSERT(eg.speaker == 1);
  KALDI_ASSERT(LoadThrows(loader, 1));

  opts.corpus_columns = "mels,pitch,text";
  bool threw = false;
  try {
    ExampleLoader bad_loader(opts, entries, setup.Collaborators());
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestReadTtsCorpus() {
  LoaderTestSetup setup;
  std::string list = setup.Dir() + "/train.txt";
  {
    std::ofstream os(list.c_str());
    os << "mels/utt1.mat|pitch/utt1.vec|Some text.|1\n"
       << "mels/utt2.mat|pitch/utt2.vec|More text.|0\n";
  }
  TtsDatasetOptions opts;
  opts.dataset_path = setup.Dir();
  opts.corpus_lists = list;
  opts.n_speakers = 2;
  std::vector<CorpusEntry> entries;
  ReadTtsCorpus(opts, &entries);
  KALDI_ASSERT(entries.size() == 2);
  KALDI_ASSERT(entries[1].mel_path == setup.Dir() + "/mels/utt2.mat");
  KALDI_ASSERT(entries[1].pitch_path == setup.Dir() + "/pitch/utt2.vec");
  KALDI_ASSERT(entries[0].speaker == 1 && entries[0].text == "Some text.");
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestDiskFeatures();
  UnitTestEstimatedPitch();
  UnitTestComputedMels();
  UnitTestSpacesAndProsody();
  UnitTestSpeakers();
  UnitTestReadTtsCorpus();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
