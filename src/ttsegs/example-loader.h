// ttsegs/example-loader.h

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

#ifndef TTSEGS_TTSEGS_EXAMPLE_LOADER_H_
#define TTSEGS_TTSEGS_EXAMPLE_LOADER_H_

#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"
#include "ttsegs/alignment-prior.h"
#include "ttsegs/feature-sources.h"
#include "ttsegs/text-encoder.h"
#include "ttsegs/tts-corpus.h"
#include "ttsegs/tts-example.h"
#include "ttsegs/word-label-upsample.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

struct TtsDatasetOptions {
  std::string dataset_path;
  std::string corpus_lists;
  int32 n_speakers;
  std::string corpus_columns;
  bool load_mel_from_disk;
  bool load_pitch_from_disk;
  std::string pitch_online_dir;
  bool prepend_space_to_text;
  bool append_space_to_text;
  bool cwt_accent;
  bool mels_downsampled;
  bool load_ds_mel_from_disk;

  TextEncoderOptions text_opts;
  AlignmentPriorOptions prior_opts;
  PitchEstimatorOptions pitch_opts;
  kaldi::FbankOptions mel_opts;
  kaldi::FbankOptions ds_mel_opts;

  TtsDatasetOptions(): n_speakers(1),
                       load_mel_from_disk(true),
                       load_pitch_from_disk(true),
                       prepend_space_to_text(false),
                       append_space_to_text(false),
                       cwt_accent(false),
                       mels_downsampled(false),
                       load_ds_mel_from_disk(true) {
    SetDefaultMelOptions(&mel_opts);
    SetDefaultDownsampledMelOptions(&ds_mel_opts);
  }

  void Register(OptionsItf *opts) {
    opts->Register("dataset-path", &dataset_path,
                   "Root directory against which relative paths in the "
                   "corpus lists are resolved.");
    opts->Register("corpus-lists", &corpus_lists,
                   "Comma-separated list of corpus lists (rxfilenames) with "
                   "\"|\"-separated fields; they are concatenated.");
    opts->Register("n-speakers", &n_speakers,
                   "Number of speakers; with more than one the corpus lists "
                   "have a speaker column.");
    opts->Register("corpus-columns", &corpus_columns,
                   "Comma-separated column layout of the corpus lists, from "
                   "mels, pitch, text, speaker, cwt, mels_ds.  If empty it is "
                   "mels[,pitch][,cwt][,mels_ds],text[,speaker] depending on "
                   "the other options.");
    opts->Register("load-mel-from-disk", &load_mel_from_disk,
                   "If true the mels column holds Kaldi feature matrices "
                   "(frames by channels); otherwise wave files from which mels "
                   "are computed.");
    opts->Register("load-pitch-from-disk", &load_pitch_from_disk,
                   "If true the pitch column holds Kaldi matrices (frames by "
                   "formants) or vectors; otherwise pitch is estimated.");
    opts->Register("pitch-online-dir", &pitch_online_dir,
                   "Directory in which estimated pitch is cached.  Requires "
                   "--load-pitch-from-disk=false.");
    opts->Register("prepend-space-to-text", &prepend_space_to_text,
                   "Add a space token before the text.");
    opts->Register("append-space-to-text", &append_space_to_text,
                   "Add a space token after the text.");
    opts->Register("cwt-accent", &cwt_accent,
                   "Load per-word prosody (CWT accent) labels from the cwt "
                   "column and expand them to token level.");
    opts->Register("mels-downsampled", &mels_downsampled,
                   "Add a downsampled mel-spectrogram to each example.");
    opts->Register("load-ds-mel-from-disk", &load_ds_mel_from_disk,
                   "If true the mels_ds column holds Kaldi feature matrices; "
                   "otherwise wave files from which they are computed with "
                   "the --ds.* options.");
    text_opts.Register(opts);
    prior_opts.Register(opts);
    pitch_opts.Register(opts);
    mel_opts.Register(opts);
    kaldi::ParseOptions ds_po("ds", opts);
    ds_mel_opts.Register(&ds_po);
  }

  /// Throws on invalid or conflicting options.
  void Check() const;

  /// The column layout of the corpus lists.
  void CorpusColumns(std::vector<CorpusColumn> *columns) const;
};


/// Collaborators used by ExampleLoader.  Pointers are not owned; those that
/// the options do not need may be NULL.
struct TtsCollaborators {
  const TextEncoder *text_encoder;
  const WaveformLoader *waveform_loader;
  const SpectrogramExtractor *mel_extractor;
  const SpectrogramExtractor *ds_mel_extractor;
  const PitchEstimator *pitch_estimator;
  const WordLabelUpsampler *label_upsampler;

  TtsCollaborators(): text_encoder(NULL), waveform_loader(NULL),
                      mel_extractor(NULL), ds_mel_extractor(NULL),
                      pitch_estimator(NULL), label_upsampler(NULL) { }
};

/// Owns the Kaldi based collaborators configured by a TtsDatasetOptions.
class DefaultTtsCollaborators {
 public:
  explicit DefaultTtsCollaborators(const TtsDatasetOptions &opts);
  ~DefaultTtsCollaborators();
  const TtsCollaborators &Get() const { return collaborators_; }
 private:
  SymbolTableTextEncoder *text_encoder_;
  WaveDataLoader waveform_loader_;
  FbankSpectrogramExtractor mel_extractor_;
  FbankSpectrogramExtractor ds_mel_extractor_;
  KaldiPitchEstimator pitch_estimator_;
  RepeatWordLabelUpsampler label_upsampler_;
  TtsCollaborators collaborators_;
  KALDI_DISALLOW_COPY_AND_ASSIGN(DefaultTtsCollaborators);
};


/// Where mel-spectrograms (channels by frames) come from.
class MelSource {
 public:
  virtual void GetMel(const std::string &path, Matrix<BaseFloat> *mel) const = 0;
  virtual std::string Type() const = 0;
  virtual ~MelSource() { }
};

/// Kaldi feature matrices (frames by channels) read from disk and transposed.
class DiskMelSource: public MelSource {
 public:
  virtual void GetMel(const std::string &path, Matrix<BaseFloat> *mel) const;
  virtual std::string Type() const { return "disk"; }
};

/// Computed from a wave file.
class ComputedMelSource: public MelSource {
 public:
  ComputedMelSource(const WaveformLoader *loader,
                    const SpectrogramExtractor *extractor):
      loader_(loader), extractor_(extractor) { }
  virtual void GetMel(const std::string &path, Matrix<BaseFloat> *mel) const;
  virtual std::string Type() const { return "computed"; }
 private:
  const WaveformLoader *loader_;
  const SpectrogramExtractor *extractor_;
};


/// Where pitch contours (formants by frames) come from.
class PitchSource {
 public:
  /// "num_frames" is the number of mel frames of the utterance.
  virtual void GetPitch(const CorpusEntry &entry, int32 num_frames,
                        Matrix<BaseFloat> *pitch) const = 0;
  virtual std::string Type() const = 0;
  virtual ~PitchSource() { }
};

/// Pitch column read from disk: a Kaldi matrix of frames by formants, or a
/// vector for a single formant.
class DiskPitchSource: public PitchSource {
 public:
  virtual void GetPitch(const CorpusEntry &entry, int32 num_frames,
                        Matrix<BaseFloat> *pitch) const;
  virtual std::string Type() const { return "disk"; }
};

/// Estimated from the waveform of the utterance on every request.
class ComputedPitchSource: public PitchSource {
 public:
  ComputedPitchSource(const PitchEstimator *estimator,
                      const PitchEstimatorOptions &opts):
      estimator_(estimator), opts_(opts) { }
  virtual void GetPitch(const CorpusEntry &entry, int32 num_frames,
                        Matrix<BaseFloat> *pitch) const;
  virtual std::string Type() const { return "computed"; }
 protected:
  const PitchEstimator *estimator_;
  PitchEstimatorOptions opts_;
};

/// Estimated pitch cached on disk under cache_dir, keyed by the mel path.
/// A cached file is used whatever its length.
class CachedPitchSource: public ComputedPitchSource {
 public:
  CachedPitchSource(const std::string &cache_dir,
                    const std::string &dataset_path,
                    const PitchEstimator *estimator,
                    const PitchEstimatorOptions &opts):
      ComputedPitchSource(estimator, opts), cache_dir_(cache_dir),
      dataset_path_(dataset_path) { }
  virtual void GetPitch(const CorpusEntry &entry, int32 num_frames,
                        Matrix<BaseFloat> *pitch) const;
  virtual std::string Type() const { return "cached"; }
 private:
  std::string cache_dir_;
  std::string dataset_path_;
};


/**
   Builds TtsExample objects from corpus entries.  All configuration is
   checked, and the mel, pitch and prior sources are chosen, in the
   constructor.  Load() is const and may be called concurrently for
   different indices.
*/
class ExampleLoader {
 public:
  ExampleLoader(const TtsDatasetOptions &opts,
                const std::vector<CorpusEntry> &entries,
                const TtsCollaborators &collaborators);

  ~ExampleLoader();

  int32 NumExamples() const { return entries_.size(); }

  const CorpusEntry &Entry(int32 index) const;

  /// Loads example "index" (0 <= index < NumExamples()).  Throws on errors.
  void Load(int32 index, TtsExample *eg) const;

  const AlignmentPriorSource &PriorSource() const { return *prior_source_; }
  const MelSource &GetMelSource() const { return *mel_source_; }
  const PitchSource &GetPitchSource() const { return *pitch_source_; }

 private:
  void EncodeText(const CorpusEntry &entry, TtsExample *eg) const;

  TtsDatasetOptions opts_;
  std::vector<CorpusEntry> entries_;
  TtsCollaborators collaborators_;

  MelSource *mel_source_;
  MelSource *ds_mel_source_;  // NULL unless mels_downsampled
  PitchSource *pitch_source_;
  AlignmentPriorSource *prior_source_;

  KALDI_DISALLOW_COPY_AND_ASSIGN(ExampleLoader);
};

/// Reads the corpus lists named in opts.corpus_lists.
void ReadTtsCorpus(const TtsDatasetOptions &opts,
                   std::vector<CorpusEntry> *entries);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_EXAMPLE_LOADER_H_
