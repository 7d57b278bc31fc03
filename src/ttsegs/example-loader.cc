// ttsegs/example-loader.cc

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

#include "ttsegs/example-loader.h"
#include "ttsegs/feature-cache.h"

namespace ttsegs {

static bool HasColumn(const std::vector<CorpusColumn> &columns,
                      CorpusColumn column) {
  return std::find(columns.begin(), columns.end(), column) != columns.end();
}

void TtsDatasetOptions::CorpusColumns(
    std::vector<CorpusColumn> *columns) const {
  if (!corpus_columns.empty())
    ParseCorpusColumns(corpus_columns, columns);
  else
    DefaultCorpusColumns(load_pitch_from_disk, cwt_accent, mels_downsampled,
                         n_speakers > 1, columns);
}

void TtsDatasetOptions::Check() const {
  if (n_speakers < 1)
    KALDI_ERR << "--n-speakers must be at least 1, got " << n_speakers;
  if (load_pitch_from_disk && !pitch_online_dir.empty())
    KALDI_ERR << "--pitch-online-dir caches estimated pitch and cannot be "
              << "used with --load-pitch-from-disk=true";
  if (text_opts.p_arpabet != 0.0 && text_opts.p_arpabet != 1.0)
    KALDI_ERR << "--p-arpabet must be 0 or 1, got " << text_opts.p_arpabet;
  prior_opts.Check();
  if (!load_pitch_from_disk)
    pitch_opts.Check();

  std::vector<CorpusColumn> columns;
  CorpusColumns(&columns);
  if (load_pitch_from_disk && !HasColumn(columns, kPitchColumn))
    KALDI_ERR << "--load-pitch-from-disk=true needs a pitch column";
  if (cwt_accent && !HasColumn(columns, kCwtColumn))
    KALDI_ERR << "--cwt-accent=true needs a cwt column";
  if (mels_downsampled && !HasColumn(columns, kMelsDsColumn))
    KALDI_ERR << "--mels-downsampled=true needs a mels_ds column";
  if (n_speakers > 1 && !HasColumn(columns, kSpeakerColumn))
    KALDI_ERR << "--n-speakers=" << n_speakers << " needs a speaker column";
}


DefaultTtsCollaborators::DefaultTtsCollaborators(
    const TtsDatasetOptions &opts):
    text_encoder_(NULL),
    mel_extractor_(opts.mel_opts),
    ds_mel_extractor_(opts.ds_mel_opts),
    pitch_estimator_(&waveform_loader_) {
  text_encoder_ = new SymbolTableTextEncoder(opts.text_opts);
  collaborators_.text_encoder = text_encoder_;
  collaborators_.waveform_loader = &waveform_loader_;
  collaborators_.mel_extractor = &mel_extractor_;
  collaborators_.ds_mel_extractor = &ds_mel_extractor_;
  collaborators_.pitch_estimator = &pitch_estimator_;
  collaborators_.label_upsampler = &label_upsampler_;
}

DefaultTtsCollaborators::~DefaultTtsCollaborators() {
  delete text_encoder_;
}


void DiskMelSource::GetMel(const std::string &path,
                           Matrix<BaseFloat> *mel) const {
  Matrix<BaseFloat> feats;
  kaldi::ReadKaldiObject(path, &feats);
  mel->Resize(feats.NumCols(), feats.NumRows(), kaldi::kUndefined);
  mel->CopyFromMat(feats, kaldi::kTrans);
}

void ComputedMelSource::GetMel(const std::string &path,
                               Matrix<BaseFloat> *mel) const {
  Vector<BaseFloat> samples;
  BaseFloat samp_freq;
  loader_->Load(path, &samples, &samp_freq);
  extractor_->Extract(samples, samp_freq, mel);
}


void DiskPitchSource::GetPitch(const CorpusEntry &entry, int32 num_frames,
                               Matrix<BaseFloat> *pitch) const {
  if (entry.pitch_path.empty())
    KALDI_ERR << "No pitch file for " << entry.mel_path;
  Matrix<BaseFloat> feats;
  bool was_vector;
  ReadFeatureMatrix(entry.pitch_path, &feats, &was_vector);
  if (was_vector) {
    pitch->Swap(&feats);
  } else {
    pitch->Resize(feats.NumCols(), feats.NumRows(), kaldi::kUndefined);
    pitch->CopyFromMat(feats, kaldi::kTrans);
  }
}

void ComputedPitchSource::GetPitch(const CorpusEntry &entry, int32 num_frames,
                                   Matrix<BaseFloat> *pitch) const {
  estimator_->Estimate(WavPathForMel(entry.mel_path), num_frames, opts_,
                       pitch);
}

void CachedPitchSource::GetPitch(const CorpusEntry &entry, int32 num_frames,
                                 Matrix<BaseFloat> *pitch) const {
  std::string path = CachePathForAudio(cache_dir_, dataset_path_,
                                       entry.mel_path);
  if (ReadCachedMatrix(path, pitch)) {
    KALDI_VLOG(3) << "Read cached pitch " << path;
    return;
  }
  ComputedPitchSource::GetPitch(entry, num_frames, pitch);
  try {
    WriteMatrixAtomic(path, *pitch);
  } catch (const std::exception &e) {
    KALDI_WARN << "Could not write pitch cache file " << path << ": "
               << e.what();
  }
}


ExampleLoader::ExampleLoader(const TtsDatasetOptions &opts,
                             const std::vector<CorpusEntry> &entries,
                             const TtsCollaborators &collaborators):
    opts_(opts), entries_(entries), collaborators_(collaborators),
    mel_source_(NULL), ds_mel_source_(NULL), pitch_source_(NULL),
    prior_source_(NULL) {
  opts_.Check();
  const TtsCollaborators &c = collaborators_;
  if (c.text_encoder == NULL)
    KALDI_ERR << "No text encoder given";
  if (!opts_.load_mel_from_disk &&
      (c.waveform_loader == NULL || c.mel_extractor == NULL))
    KALDI_ERR << "Computing mels needs a waveform loader and an extractor";
  if (opts_.mels_downsampled && !opts_.load_ds_mel_from_disk &&
      (c.waveform_loader == NULL || c.ds_mel_extractor == NULL))
    KALDI_ERR << "Computing downsampled mels needs a waveform loader and an "
              << "extractor";
  if (!opts_.load_pitch_from_disk && c.pitch_estimator == NULL)
    KALDI_ERR << "Estimating pitch needs a pitch estimator";
  if (opts_.cwt_accent && c.label_upsampler == NULL)
    KALDI_ERR << "--cwt-accent=true needs a word label upsampler";

  if (opts_.load_mel_from_disk)
    mel_source_ = new DiskMelSource();
  else
    mel_source_ = new ComputedMelSource(c.waveform_loader, c.mel_extractor);

  if (opts_.mels_downsampled) {
    if (opts_.load_ds_mel_from_disk)
      ds_mel_source_ = new DiskMelSource();
    else
      ds_mel_source_ = new ComputedMelSource(c.waveform_loader,
                                             c.ds_mel_extractor);
  }

  if (opts_.load_pitch_from_disk)
    pitch_source_ = new DiskPitchSource();
  else if (!opts_.pitch_online_dir.empty())
    pitch_source_ = new CachedPitchSource(opts_.pitch_online_dir,
                                          opts_.dataset_path,
                                          c.pitch_estimator, opts_.pitch_opts);
  else
    pitch_source_ = new ComputedPitchSource(c.pitch_estimator,
                                            opts_.pitch_opts);

  prior_source_ = NewAlignmentPriorSource(opts_.prior_opts,
                                          opts_.dataset_path);

  KALDI_LOG << "Loading " << entries_.size() << " examples: "
            << mel_source_->Type() << " mels, " << pitch_source_->Type()
            << " pitch, " << prior_source_->Type() << " alignment priors"
            << (ds_mel_source_ != NULL ? ", " + ds_mel_source_->Type() +
                " downsampled mels" : std::string(""));
}

ExampleLoader::~ExampleLoader() {
  delete mel_source_;
  delete ds_mel_source_;
  delete pitch_source_;
  delete prior_source_;
}

const CorpusEntry &ExampleLoader::Entry(int32 index) const {
  if (index < 0 || index >= NumExamples())
    KALDI_ERR << "Example index " << index << " out of range [0, "
              << NumExamples() << ")";
  return entries_[index];
}

void ExampleLoader::EncodeText(const CorpusEntry &entry,
                               TtsExample *eg) const {
  const TextEncoder &encoder = *collaborators_.text_encoder;
  std::vector<int32> word_counts;
  encoder.Encode(entry.text, &eg->text,
                 opts_.cwt_accent ? &word_counts : NULL);
  eg->has_prosody = opts_.cwt_accent;
  eg->prosody.clear();
  if (opts_.cwt_accent) {
    if (entry.cwt_path.empty())
      KALDI_ERR << "No prosody label file for " << entry.mel_path;
    std::vector<int32> word_labels;
    ReadWordLabels(entry.cwt_path, &word_labels);
    collaborators_.label_upsampler->Upsample(word_counts, word_labels,
                                             &eg->prosody);
  }
  // added spaces carry no prosody label
  int32 space = encoder.SpaceId();
  if (opts_.prepend_space_to_text) {
    eg->text.insert(eg->text.begin(), space);
    if (eg->has_prosody) eg->prosody.insert(eg->prosody.begin(), 0);
  }
  if (opts_.append_space_to_text) {
    eg->text.push_back(space);
    if (eg->has_prosody) eg->prosody.push_back(0);
  }
}

void ExampleLoader::Load(int32 index, TtsExample *eg) const {
  const CorpusEntry &entry = Entry(index);
  eg->audio_path = entry.mel_path;

  mel_source_->GetMel(entry.mel_path, &eg->mel);
  int32 num_frames = eg->mel.NumCols();
  if (num_frames == 0)
    KALDI_ERR << "Mel of " << entry.mel_path << " has no frames";

  EncodeText(entry, eg);

  pitch_source_->GetPitch(entry, num_frames, &eg->pitch);
  if (eg->pitch.NumCols() != num_frames)
    KALDI_ERR << "Pitch of " << entry.mel_path << " has "
              << eg->pitch.NumCols() << " frames but the mel has "
              << num_frames;

  ComputeFrameEnergy(eg->mel, &eg->energy);

  if (opts_.n_speakers > 1) {
    if (entry.speaker < 0 || entry.speaker >= opts_.n_speakers)
      KALDI_ERR << "Speaker " << entry.speaker << " of " << entry.mel_path
                << " is not in [0, " << opts_.n_speakers << ")";
    eg->speaker = entry.speaker;
  } else {
    eg->speaker = -1;
  }

  if (eg->TextLength() == 0)
    KALDI_ERR << "Transcript of " << entry.mel_path << " encodes to no tokens";
  prior_source_->GetPrior(entry.mel_path, eg->TextLength(), num_frames,
                          &eg->prior);

  eg->has_ds_mel = (ds_mel_source_ != NULL);
  if (ds_mel_source_ != NULL) {
    if (entry.ds_mel_path.empty())
      KALDI_ERR << "No downsampled mel for " << entry.mel_path;
    ds_mel_source_->GetMel(entry.ds_mel_path, &eg->ds_mel);
  } else {
    eg->ds_mel.Resize(0, 0);
  }

  eg->Check();
  KALDI_VLOG(3) << "Loaded example " << index << " (" << entry.mel_path
                << "): " << eg->TextLength() << " tokens, " << num_frames
                << " frames";
}

void ReadTtsCorpus(const TtsDatasetOptions &opts,
                   std::vector<CorpusEntry> *entries) {
  std::vector<std::string> lists;
  kaldi::SplitStringToVector(opts.corpus_lists, ",", true, &lists);
  if (lists.empty())
    KALDI_ERR << "No corpus lists given (--corpus-lists)";
  std::vector<CorpusColumn> columns;
  opts.CorpusColumns(&columns);
  ReadCorpusLists(lists, columns, opts.dataset_path, entries);
}

}  // namespace ttsegs
