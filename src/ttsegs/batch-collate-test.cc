// ttsegs/batch-collate-test.cc

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

#include <sstream>

#include "ttsegs/batch-collate.h"

namespace ttsegs {

static void MakeExample(int32 text_len, int32 num_frames, bool optional,
                        TtsExample *eg) {
  eg->text.resize(text_len);
  for (int32 i = 0; i < text_len; i++) eg->text[i] = 1 + kaldi::Rand() % 50;
  eg->mel.Resize(4, num_frames);
  eg->mel.SetRandn();
  eg->pitch.Resize(1, num_frames);
  eg->pitch.SetRandn();
  eg->energy.Resize(num_frames);
  eg->energy.SetRandn();
  eg->prior.Resize(num_frames, text_len);
  eg->prior.Set(1.0 / text_len);
  std::ostringstream path;
  path << "/data/wavs/" << text_len << "-" << num_frames << ".wav";
  eg->audio_path = path.str();
  eg->speaker = (optional ? text_len % 3 : -1);
  eg->has_prosody = optional;
  eg->prosody.clear();
  if (optional)
    for (int32 i = 0; i < text_len; i++) eg->prosody.push_back(1 + i % 2);
  eg->has_ds_mel = optional;
  if (optional) {
    eg->ds_mel.Resize(3, num_frames / 2 + 1);
    eg->ds_mel.SetRandn();
  } else {
    eg->ds_mel.Resize(0, 0);
  }
}

static void AssertSameExample(const TtsExample &a, const TtsExample &b) {
  KALDI_ASSERT(a.text == b.text);
  KALDI_ASSERT(a.mel.ApproxEqual(b.mel, 1.0e-05));
  KALDI_ASSERT(a.pitch.ApproxEqual(b.pitch, 1.0e-05));
  KALDI_ASSERT(a.energy.ApproxEqual(b.energy, 1.0e-05));
  KALDI_ASSERT(a.prior.ApproxEqual(b.prior, 1.0e-05));
  KALDI_ASSERT(a.speaker == b.speaker && a.audio_path == b.audio_path);
  KALDI_ASSERT(a.has_prosody == b.has_prosody && a.prosody == b.prosody);
  KALDI_ASSERT(a.has_ds_mel == b.has_ds_mel);
  if (a.has_ds_mel) KALDI_ASSERT(a.ds_mel.ApproxEqual(b.ds_mel, 1.0e-05));
}

void UnitTestSortAndPad() {
  std::vector<TtsExample> egs(3);
  MakeExample(5, 20, false, &egs[0]);
  MakeExample(3, 30, false, &egs[1]);
  MakeExample(8, 10, false, &egs[2]);
  TtsBatch batch;
  CollateExamples(egs, &batch);

  KALDI_ASSERT(batch.NumExamples() == 3);
  KALDI_ASSERT(batch.sort_order[0] == 2 && batch.sort_order[1] == 0 &&
               batch.sort_order[2] == 1);
  KALDI_ASSERT(batch.input_lengths[0] == 8 && batch.input_lengths[1] == 5 &&
               batch.input_lengths[2] == 3);
  KALDI_ASSERT(batch.output_lengths[0] == 10 &&
               batch.output_lengths[1] == 20 &&
               batch.output_lengths[2] == 30);
  KALDI_ASSERT(batch.MaxTextLength() == 8 && batch.MaxFrames() == 30);
  KALDI_ASSERT(batch.TotalFrames() == 60);
  KALDI_ASSERT(!batch.has_speakers && !batch.has_prosody &&
               !batch.has_ds_mel);

  // the shortest text is padded with 5 zeros
  const std::vector<int32> &row = batch.text[2];
  KALDI_ASSERT(row.size() == 8);
  for (int32 i = 0; i < 3; i++) KALDI_ASSERT(row[i] == egs[1].text[i]);
  for (int32 i = 3; i < 8; i++) KALDI_ASSERT(row[i] == 0);
  KALDI_ASSERT(batch.token_counts[2] == 3);
  // token counts follow the rows; sort_order maps them back to input order
  std::vector<int32> input_counts(3, -1);
  for (int32 r = 0; r < 3; r++)
    input_counts[batch.sort_order[r]] = batch.token_counts[r];
  for (int32 i = 0; i < 3; i++)
    KALDI_ASSERT(input_counts[i] == egs[i].TextLength());

  for (int32 r = 0; r < 3; r++) {
    const TtsExample &eg = egs[batch.sort_order[r]];
    int32 t = eg.NumFrames(), l = eg.TextLength();
    KALDI_ASSERT(batch.mel[r].NumRows() == 4 &&
                 batch.mel[r].NumCols() == 30);
    KALDI_ASSERT(batch.pitch[r].NumRows() == 1 &&
                 batch.pitch[r].NumCols() == 30);
    KALDI_ASSERT(batch.prior[r].NumRows() == 30 &&
                 batch.prior[r].NumCols() == 8);
    KALDI_ASSERT(batch.audio_paths[r] == eg.audio_path);
    for (int32 f = t; f < 30; f++) {
      KALDI_ASSERT(batch.energy(r, f) == 0.0 && batch.pitch[r](0, f) == 0.0);
      for (int32 c = 0; c < 4; c++) KALDI_ASSERT(batch.mel[r](c, f) == 0.0);
      for (int32 i = 0; i < 8; i++) KALDI_ASSERT(batch.prior[r](f, i) == 0.0);
    }
    for (int32 f = 0; f < t; f++)
      for (int32 i = l; i < 8; i++) KALDI_ASSERT(batch.prior[r](f, i) == 0.0);
  }
}

void UnitTestTiesKeepOrder() {
  std::vector<TtsExample> egs(3);
  MakeExample(4, 5, false, &egs[0]);
  MakeExample(4, 7, false, &egs[1]);
  MakeExample(6, 3, false, &egs[2]);
  TtsBatch batch;
  CollateExamples(egs, &batch);
  KALDI_ASSERT(batch.sort_order[0] == 2 && batch.sort_order[1] == 0 &&
               batch.sort_order[2] == 1);
}

void UnitTestOptionalFields() {
  std::vector<TtsExample> egs(4);
  for (int32 i = 0; i < 4; i++)
    MakeExample(3 + kaldi::Rand() % 10, 5 + kaldi::Rand() % 20, true,
                &egs[i]);
  TtsBatch batch;
  CollateExamples(egs, &batch);
  KALDI_ASSERT(batch.has_speakers && batch.has_prosody && batch.has_ds_mel);
  for (int32 r = 0; r < 4; r++) {
    const TtsExample &eg = egs[batch.sort_order[r]];
    KALDI_ASSERT(batch.speakers[r] == eg.speaker);
    KALDI_ASSERT(batch.ds_output_lengths[r] == eg.ds_mel.NumCols());
    KALDI_ASSERT(batch.prosody[r].size() ==
                 static_cast<size_t>(batch.MaxTextLength()));
    TtsExample unpadded;
    UnpadExample(batch, r, &unpadded);
    AssertSameExample(eg, unpadded);
  }

  // mixed presence is rejected
  egs[2].has_prosody = false;
  egs[2].prosody.clear();
  bool threw = false;
  try {
    CollateExamples(egs, &batch);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);

  threw = false;
  try {
    CollateExamples(std::vector<TtsExample>(), &batch);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestBatchIo() {
  for (int32 binary = 0; binary <= 1; binary++) {
    std::vector<TtsExample> egs(3);
    for (int32 i = 0; i < 3; i++)
      MakeExample(3 + i, 6 + 2 * i, binary != 0, &egs[i]);
    egs[1].audio_path.clear();
    TtsBatch batch, batch2;
    CollateExamples(egs, &batch);
    std::ostringstream os;
    batch.Write(os, binary != 0);
    std::istringstream is(os.str());
    batch2.Read(is, binary != 0);
    KALDI_ASSERT(batch2.NumExamples() == 3);
    KALDI_ASSERT(batch2.sort_order == batch.sort_order);
    KALDI_ASSERT(batch2.audio_paths == batch.audio_paths);
    KALDI_ASSERT(batch2.has_ds_mel == batch.has_ds_mel);
    for (int32 r = 0; r < 3; r++) {
      TtsExample a, b;
      UnpadExample(batch, r, &a);
      UnpadExample(batch2, r, &b);
      KALDI_ASSERT(a.text == b.text && a.speaker == b.speaker);
      KALDI_ASSERT(a.mel.ApproxEqual(b.mel, 1.0e-04));
      KALDI_ASSERT(a.prior.ApproxEqual(b.prior, 1.0e-04));
      KALDI_ASSERT(a.prosody == b.prosody);
    }
  }
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestSortAndPad();
  UnitTestTiesKeepOrder();
  UnitTestOptionalFields();
  UnitTestBatchIo();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
