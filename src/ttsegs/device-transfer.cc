// ttsegs/device-transfer.cc

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

#include "cudamatrix/cu-device.h"
#include "ttsegs/device-transfer.h"

namespace ttsegs {

// Stacks equally sized matrices vertically.
static void StackMatrices(const std::vector<Matrix<BaseFloat> > &mats,
                          int32 rows_each, int32 num_cols,
                          CuMatrix<BaseFloat> *out) {
  int32 num_rows = rows_each * mats.size();
  if (num_rows == 0 || num_cols == 0) {
    out->Resize(0, 0);
    return;
  }
  Matrix<BaseFloat> stacked(num_rows, num_cols, kaldi::kUndefined);
  for (size_t i = 0; i < mats.size(); i++) {
    KALDI_ASSERT(mats[i].NumRows() == rows_each &&
                 mats[i].NumCols() == num_cols);
    stacked.RowRange(i * rows_each, rows_each).CopyFromMat(mats[i]);
  }
  out->Swap(&stacked);
}

static void FlattenLists(const std::vector<std::vector<int32> > &lists,
                         CuArray<int32> *out) {
  std::vector<int32> flat;
  for (size_t i = 0; i < lists.size(); i++)
    flat.insert(flat.end(), lists[i].begin(), lists[i].end());
  out->CopyFromVec(flat);
}

int64 TransferBatch(const TtsBatch &batch, TtsBatchInputs *inputs,
                    TtsBatchTargets *targets) {
  int32 n = batch.NumExamples();
  if (n == 0)
    KALDI_ERR << "Cannot transfer an empty batch";
  inputs->num_examples = n;
  inputs->max_text_length = batch.MaxTextLength();
  inputs->max_frames = batch.MaxFrames();
  inputs->num_channels = batch.mel[0].NumRows();
  inputs->num_formants = batch.pitch[0].NumRows();

  FlattenLists(batch.text, &inputs->text);
  inputs->input_lengths.CopyFromVec(batch.input_lengths);
  StackMatrices(batch.mel, inputs->num_channels, inputs->max_frames,
                &inputs->mel);
  inputs->output_lengths.CopyFromVec(batch.output_lengths);
  StackMatrices(batch.pitch, inputs->num_formants, inputs->max_frames,
                &inputs->pitch);
  inputs->energy.Resize(batch.energy.NumRows(), batch.energy.NumCols(),
                        kaldi::kUndefined);
  inputs->energy.CopyFromMat(batch.energy);
  inputs->has_speakers = batch.has_speakers;
  if (batch.has_speakers)
    inputs->speakers.CopyFromVec(batch.speakers);
  else
    inputs->speakers.Resize(0);
  StackMatrices(batch.prior, inputs->max_frames, inputs->max_text_length,
                &inputs->prior);
  inputs->audio_paths = batch.audio_paths;
  inputs->has_prosody = batch.has_prosody;
  if (batch.has_prosody)
    FlattenLists(batch.prosody, &inputs->prosody);
  else
    inputs->prosody.Resize(0);
  inputs->has_ds_mel = batch.has_ds_mel;
  if (batch.has_ds_mel) {
    inputs->ds_channels = batch.ds_mel[0].NumRows();
    StackMatrices(batch.ds_mel, inputs->ds_channels,
                  batch.ds_mel[0].NumCols(), &inputs->ds_mel);
    inputs->ds_output_lengths.CopyFromVec(batch.ds_output_lengths);
  } else {
    inputs->ds_channels = 0;
    inputs->ds_mel.Resize(0, 0);
    inputs->ds_output_lengths.Resize(0);
  }

  targets->mel = inputs->mel;
  targets->input_lengths = inputs->input_lengths;
  targets->output_lengths = inputs->output_lengths;

  int64 num_frames = batch.TotalFrames();
  KALDI_VLOG(3) << "Transferred batch of " << n << " examples, "
                << num_frames << " frames";
  return num_frames;
}

void SelectDevice(const std::string &use_gpu) {
#if HAVE_CUDA == 1
  kaldi::CuDevice::Instantiate().SelectGpuId(use_gpu);
#else
  if (use_gpu == "yes")
    KALDI_ERR << "--use-gpu=yes but this build has no CUDA support";
#endif
}

}  // namespace ttsegs
