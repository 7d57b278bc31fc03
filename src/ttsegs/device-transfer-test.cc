// ttsegs/device-transfer-test.cc

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

#include "ttsegs/device-transfer.h"

namespace ttsegs {

static void MakeExample(int32 text_len, int32 num_frames, bool optional,
                        TtsExample *eg) {
  eg->text.assign(text_len, 7);
  eg->mel.Resize(3, num_frames);
  eg->mel.SetRandn();
  eg->pitch.Resize(1, num_frames);
  eg->pitch.Set(text_len);
  eg->energy.Resize(num_frames);
  eg->energy.Set(1.0);
  eg->prior.Resize(num_frames, text_len);
  eg->prior.Set(1.0 / text_len);
  eg->speaker = (optional ? text_len : -1);
  eg->has_prosody = optional;
  eg->prosody.assign(optional ? text_len : 0, 1);
  eg->has_ds_mel = optional;
  if (optional) {
    eg->ds_mel.Resize(2, num_frames / 2);
    eg->ds_mel.Set(0.5);
  }
}

void UnitTestTransferBatch(bool optional) {
  std::vector<TtsExample> egs(3);
  MakeExample(4, 10, optional, &egs[0]);
  MakeExample(6, 8, optional, &egs[1]);
  MakeExample(2, 12, optional, &egs[2]);
  TtsBatch batch;
  CollateExamples(egs, &batch);

  TtsBatchInputs inputs;
  TtsBatchTargets targets;
  int64 num_frames = TransferBatch(batch, &inputs, &targets);
  KALDI_ASSERT(num_frames == 30);
  KALDI_ASSERT(inputs.num_examples == 3 && inputs.max_text_length == 6 &&
               inputs.max_frames == 12 && inputs.num_channels == 3 &&
               inputs.num_formants == 1);
  KALDI_ASSERT(inputs.text.Dim() == 18 && inputs.input_lengths.Dim() == 3);
  KALDI_ASSERT(inputs.mel.NumRows() == 9 && inputs.mel.NumCols() == 12);
  KALDI_ASSERT(inputs.pitch.NumRows() == 3 && inputs.pitch.NumCols() == 12);
  KALDI_ASSERT(inputs.energy.NumRows() == 3 &&
               inputs.energy.NumCols() == 12);
  KALDI_ASSERT(inputs.prior.NumRows() == 36 && inputs.prior.NumCols() == 6);
  KALDI_ASSERT(inputs.audio_paths.size() == 3);

  // example 1 (6 tokens) comes first
  Matrix<BaseFloat> mel(inputs.mel.NumRows(), inputs.mel.NumCols());
  inputs.mel.CopyToMat(&mel);
  KALDI_ASSERT(kaldi::ApproxEqual(mel(4, 3), egs[0].mel(1, 3)));
  KALDI_ASSERT(mel(0, 9) == 0.0 && mel(2, 11) == 0.0);
  Matrix<BaseFloat> pitch(inputs.pitch.NumRows(), inputs.pitch.NumCols());
  inputs.pitch.CopyToMat(&pitch);
  KALDI_ASSERT(pitch(0, 0) == 6.0 && pitch(2, 11) == 2.0);
  std::vector<int32> text, lengths;
  inputs.text.CopyToVec(&text);
  KALDI_ASSERT(text[5] == 7 && text[6 + 4] == 0 && text[12 + 1] == 7 &&
               text[12 + 2] == 0);
  inputs.output_lengths.CopyToVec(&lengths);
  KALDI_ASSERT(lengths[0] == 8 && lengths[1] == 10 && lengths[2] == 12);

  KALDI_ASSERT(targets.mel.NumRows() == 9);
  KALDI_ASSERT(targets.input_lengths.Dim() == 3 &&
               targets.output_lengths.Dim() == 3);

  KALDI_ASSERT(inputs.has_speakers == optional &&
               inputs.has_prosody == optional &&
               inputs.has_ds_mel == optional);
  if (optional) {
    std::vector<int32> speakers;
    inputs.speakers.CopyToVec(&speakers);
    KALDI_ASSERT(speakers.size() == 3 && speakers[0] == 6);
    KALDI_ASSERT(inputs.prosody.Dim() == 18);
    KALDI_ASSERT(inputs.ds_channels == 2 && inputs.ds_mel.NumRows() == 6 &&
                 inputs.ds_mel.NumCols() == 6);
    KALDI_ASSERT(inputs.ds_output_lengths.Dim() == 3);
  } else {
    KALDI_ASSERT(inputs.speakers.Dim() == 0 && inputs.prosody.Dim() == 0 &&
                 inputs.ds_mel.NumRows() == 0);
  }
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  SelectDevice("no");
  UnitTestTransferBatch(false);
  UnitTestTransferBatch(true);
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
