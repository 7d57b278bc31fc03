// ttsegs/batch-collate.cc

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

#include "ttsegs/batch-collate.h"

namespace ttsegs {

namespace {

// Orders example indices by decreasing text length.
struct TextLengthGreater {
  explicit TextLengthGreater(const std::vector<TtsExample> &examples):
      examples_(examples) { }
  bool operator () (int32 a, int32 b) const {
    return examples_[a].TextLength() > examples_[b].TextLength();
  }
  const std::vector<TtsExample> &examples_;
};

}  // namespace

int64 TtsBatch::TotalFrames() const {
  int64 ans = 0;
  for (size_t i = 0; i < output_lengths.size(); i++)
    ans += output_lengths[i];
  return ans;
}

// Copies "in" into the top-left corner of "out", which is num_rows by
// num_cols and zero elsewhere.
static void PadMatrix(const MatrixBase<BaseFloat> &in,
                      int32 num_rows, int32 num_cols,
                      Matrix<BaseFloat> *out) {
  KALDI_ASSERT(in.NumRows() <= num_rows && in.NumCols() <= num_cols);
  if (num_rows == 0 || num_cols == 0) {
    out->Resize(0, 0);
    return;
  }
  out->Resize(num_rows, num_cols);
  if (in.NumRows() > 0 && in.NumCols() > 0)
    out->Range(0, in.NumRows(), 0, in.NumCols()).CopyFromMat(in);
}

static void PadVector(const std::vector<int32> &in, int32 dim,
                      std::vector<int32> *out) {
  KALDI_ASSERT(static_cast<int32>(in.size()) <= dim);
  out->assign(dim, 0);
  std::copy(in.begin(), in.end(), out->begin());
}

static void CheckUniform(const char *what, bool first, bool other,
                         const TtsExample &eg) {
  if (first != other)
    KALDI_ERR << "Examples in a batch must all have " << what << " or all "
              << "lack it; " << eg.audio_path << " differs from the first "
              << "example.";
}

void CollateExamples(const std::vector<TtsExample> &examples,
                     TtsBatch *batch) {
  int32 n = examples.size();
  if (n == 0)
    KALDI_ERR << "Cannot collate an empty list of examples.";

  std::vector<int32> order(n);
  for (int32 i = 0; i < n; i++) order[i] = i;
  std::stable_sort(order.begin(), order.end(), TextLengthGreater(examples));

  const TtsExample &first = examples[order[0]];
  int32 max_text = first.TextLength(),
      num_channels = first.mel.NumRows(),
      num_formants = first.pitch.NumRows(),
      ds_channels = first.ds_mel.NumRows(),
      max_frames = 0, max_ds_frames = 0;
  for (int32 r = 0; r < n; r++) {
    const TtsExample &eg = examples[order[r]];
    eg.Check();
    if (eg.mel.NumRows() != num_channels)
      KALDI_ERR << "Mel of " << eg.audio_path << " has " << eg.mel.NumRows()
                << " channels, expected " << num_channels;
    if (eg.pitch.NumRows() != num_formants)
      KALDI_ERR << "Pitch of " << eg.audio_path << " has "
                << eg.pitch.NumRows() << " formants, expected "
                << num_formants;
    CheckUniform("a speaker", first.HasSpeaker(), eg.HasSpeaker(), eg);
    CheckUniform("prosody labels", first.has_prosody, eg.has_prosody, eg);
    CheckUniform("a downsampled mel", first.has_ds_mel, eg.has_ds_mel, eg);
    if (eg.has_ds_mel && eg.ds_mel.NumRows() != ds_channels)
      KALDI_ERR << "Downsampled mel of " << eg.audio_path << " has "
                << eg.ds_mel.NumRows() << " channels, expected "
                << ds_channels;
    max_frames = std::max(max_frames, eg.NumFrames());
    max_ds_frames = std::max(max_ds_frames, eg.ds_mel.NumCols());
  }

  batch->has_speakers = first.HasSpeaker();
  batch->has_prosody = first.has_prosody;
  batch->has_ds_mel = first.has_ds_mel;

  batch->text.resize(n);
  batch->mel.resize(n);
  batch->pitch.resize(n);
  if (max_frames > 0)
    batch->energy.Resize(n, max_frames);
  else
    batch->energy.Resize(0, 0);
  batch->prior.resize(n);
  batch->speakers.clear();
  batch->prosody.clear();
  batch->ds_mel.clear();
  batch->ds_output_lengths.clear();
  if (batch->has_speakers) batch->speakers.resize(n);
  if (batch->has_prosody) batch->prosody.resize(n);
  if (batch->has_ds_mel) {
    batch->ds_mel.resize(n);
    batch->ds_output_lengths.resize(n);
  }
  batch->input_lengths.resize(n);
  batch->output_lengths.resize(n);
  batch->token_counts.resize(n);
  batch->sort_order = order;
  batch->audio_paths.resize(n);

  for (int32 r = 0; r < n; r++) {
    const TtsExample &eg = examples[order[r]];
    int32 num_frames = eg.NumFrames();
    PadVector(eg.text, max_text, &(batch->text[r]));
    PadMatrix(eg.mel, num_channels, max_frames, &(batch->mel[r]));
    PadMatrix(eg.pitch, num_formants, max_frames, &(batch->pitch[r]));
    if (num_frames > 0)
      batch->energy.Row(r).Range(0, num_frames).CopyFromVec(eg.energy);
    PadMatrix(eg.prior, max_frames, max_text, &(batch->prior[r]));
    if (batch->has_speakers)
      batch->speakers[r] = eg.speaker;
    if (batch->has_prosody)
      PadVector(eg.prosody, max_text, &(batch->prosody[r]));
    if (batch->has_ds_mel) {
      PadMatrix(eg.ds_mel, ds_channels, max_ds_frames, &(batch->ds_mel[r]));
      batch->ds_output_lengths[r] = eg.ds_mel.NumCols();
    }
    batch->input_lengths[r] = eg.TextLength();
    batch->output_lengths[r] = num_frames;
    batch->token_counts[r] = eg.TextLength();
    batch->audio_paths[r] = eg.audio_path;
  }
  KALDI_VLOG(2) << "Collated " << n << " examples: max text length "
                << max_text << ", max frames " << max_frames;
}

// Inverse of PadMatrix(): the top-left num_rows by num_cols block of "in".
static void CropMatrix(const MatrixBase<BaseFloat> &in,
                       int32 num_rows, int32 num_cols,
                       Matrix<BaseFloat> *out) {
  KALDI_ASSERT(num_rows <= in.NumRows() && num_cols <= in.NumCols());
  if (num_rows == 0 || num_cols == 0) {
    out->Resize(0, 0);
    return;
  }
  out->Resize(num_rows, num_cols, kaldi::kUndefined);
  out->CopyFromMat(in.Range(0, num_rows, 0, num_cols));
}

void UnpadExample(const TtsBatch &batch, int32 row, TtsExample *eg) {
  if (row < 0 || row >= batch.NumExamples())
    KALDI_ERR << "Row " << row << " out of range for a batch of "
              << batch.NumExamples();
  int32 text_len = batch.input_lengths[row],
      num_frames = batch.output_lengths[row];
  const std::vector<int32> &text = batch.text[row];
  eg->text.assign(text.begin(), text.begin() + text_len);
  CropMatrix(batch.mel[row], batch.mel[row].NumRows(), num_frames, &eg->mel);
  CropMatrix(batch.pitch[row], batch.pitch[row].NumRows(), num_frames,
             &eg->pitch);
  eg->energy.Resize(num_frames);
  if (num_frames > 0)
    eg->energy.CopyFromVec(batch.energy.Row(row).Range(0, num_frames));
  CropMatrix(batch.prior[row], num_frames, text_len, &eg->prior);
  eg->speaker = (batch.has_speakers ? batch.speakers[row] : -1);
  eg->has_prosody = batch.has_prosody;
  if (batch.has_prosody)
    eg->prosody.assign(batch.prosody[row].begin(),
                       batch.prosody[row].begin() + text_len);
  else
    eg->prosody.clear();
  eg->has_ds_mel = batch.has_ds_mel;
  if (batch.has_ds_mel)
    CropMatrix(batch.ds_mel[row], batch.ds_mel[row].NumRows(),
               batch.ds_output_lengths[row], &eg->ds_mel);
  else
    eg->ds_mel.Resize(0, 0);
  eg->audio_path = batch.audio_paths[row];
}


static void WriteMatrixList(std::ostream &os, bool binary, const char *token,
                            const std::vector<Matrix<BaseFloat> > &mats) {
  kaldi::WriteToken(os, binary, token);
  for (size_t i = 0; i < mats.size(); i++)
    mats[i].Write(os, binary);
}

static void ReadMatrixList(std::istream &is, bool binary, const char *token,
                           int32 n, std::vector<Matrix<BaseFloat> > *mats) {
  kaldi::ExpectToken(is, binary, token);
  mats->resize(n);
  for (int32 i = 0; i < n; i++)
    (*mats)[i].Read(is, binary);
}

static void WriteIntegerLists(std::ostream &os, bool binary,
                              const char *token,
                              const std::vector<std::vector<int32> > &lists) {
  kaldi::WriteToken(os, binary, token);
  for (size_t i = 0; i < lists.size(); i++)
    kaldi::WriteIntegerVector(os, binary, lists[i]);
}

static void ReadIntegerLists(std::istream &is, bool binary, const char *token,
                             int32 n,
                             std::vector<std::vector<int32> > *lists) {
  kaldi::ExpectToken(is, binary, token);
  lists->resize(n);
  for (int32 i = 0; i < n; i++)
    kaldi::ReadIntegerVector(is, binary, &((*lists)[i]));
}

void TtsBatch::Write(std::ostream &os, bool binary) const {
  int32 n = NumExamples();
  kaldi::WriteToken(os, binary, "<TtsBatch>");
  kaldi::WriteToken(os, binary, "<NumExamples>");
  kaldi::WriteBasicType(os, binary, n);
  WriteIntegerLists(os, binary, "<Text>", text);
  WriteMatrixList(os, binary, "<Mel>", mel);
  WriteMatrixList(os, binary, "<Pitch>", pitch);
  kaldi::WriteToken(os, binary, "<Energy>");
  energy.Write(os, binary);
  WriteMatrixList(os, binary, "<Prior>", prior);
  kaldi::WriteToken(os, binary, "<InputLengths>");
  kaldi::WriteIntegerVector(os, binary, input_lengths);
  kaldi::WriteToken(os, binary, "<OutputLengths>");
  kaldi::WriteIntegerVector(os, binary, output_lengths);
  kaldi::WriteToken(os, binary, "<TokenCounts>");
  kaldi::WriteIntegerVector(os, binary, token_counts);
  kaldi::WriteToken(os, binary, "<SortOrder>");
  kaldi::WriteIntegerVector(os, binary, sort_order);
  kaldi::WriteToken(os, binary, "<AudioPaths>");
  for (int32 i = 0; i < n; i++)
    kaldi::WriteToken(os, binary, audio_paths[i].empty() ? std::string("-") :
                      audio_paths[i]);
  if (has_speakers) {
    kaldi::WriteToken(os, binary, "<Speakers>");
    kaldi::WriteIntegerVector(os, binary, speakers);
  }
  if (has_prosody)
    WriteIntegerLists(os, binary, "<Prosody>", prosody);
  if (has_ds_mel) {
    WriteMatrixList(os, binary, "<DsMel>", ds_mel);
    kaldi::WriteToken(os, binary, "<DsOutputLengths>");
    kaldi::WriteIntegerVector(os, binary, ds_output_lengths);
  }
  kaldi::WriteToken(os, binary, "</TtsBatch>");
}

void TtsBatch::Read(std::istream &is, bool binary) {
  int32 n;
  kaldi::ExpectToken(is, binary, "<TtsBatch>");
  kaldi::ExpectToken(is, binary, "<NumExamples>");
  kaldi::ReadBasicType(is, binary, &n);
  if (n < 0)
    KALDI_ERR << "Bad number of examples " << n << " in TtsBatch";
  ReadIntegerLists(is, binary, "<Text>", n, &text);
  ReadMatrixList(is, binary, "<Mel>", n, &mel);
  ReadMatrixList(is, binary, "<Pitch>", n, &pitch);
  kaldi::ExpectToken(is, binary, "<Energy>");
  energy.Read(is, binary);
  ReadMatrixList(is, binary, "<Prior>", n, &prior);
  kaldi::ExpectToken(is, binary, "<InputLengths>");
  kaldi::ReadIntegerVector(is, binary, &input_lengths);
  kaldi::ExpectToken(is, binary, "<OutputLengths>");
  kaldi::ReadIntegerVector(is, binary, &output_lengths);
  kaldi::ExpectToken(is, binary, "<TokenCounts>");
  kaldi::ReadIntegerVector(is, binary, &token_counts);
  kaldi::ExpectToken(is, binary, "<SortOrder>");
  kaldi::ReadIntegerVector(is, binary, &sort_order);
  kaldi::ExpectToken(is, binary, "<AudioPaths>");
  audio_paths.resize(n);
  for (int32 i = 0; i < n; i++) {
    kaldi::ReadToken(is, binary, &(audio_paths[i]));
    if (audio_paths[i] == "-") audio_paths[i].clear();
  }
  has_speakers = has_prosody = has_ds_mel = false;
  speakers.clear();
  prosody.clear();
  ds_mel.clear();
  ds_output_lengths.clear();
  std::string token;
  while (true) {
    kaldi::ReadToken(is, binary, &token);
    if (token == "</TtsBatch>") {
      break;
    } else if (token == "<Speakers>") {
      has_speakers = true;
      kaldi::ReadIntegerVector(is, binary, &speakers);
    } else if (token == "<Prosody>") {
      has_prosody = true;
      prosody.resize(n);
      for (int32 i = 0; i < n; i++)
        kaldi::ReadIntegerVector(is, binary, &(prosody[i]));
    } else if (token == "<DsMel>") {
      has_ds_mel = true;
      ds_mel.resize(n);
      for (int32 i = 0; i < n; i++)
        ds_mel[i].Read(is, binary);
      kaldi::ExpectToken(is, binary, "<DsOutputLengths>");
      kaldi::ReadIntegerVector(is, binary, &ds_output_lengths);
    } else {
      KALDI_ERR << "Unexpected token " << token << " in TtsBatch";
    }
  }
}

}  // namespace ttsegs
