// ttsegs/device-transfer.h

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

#ifndef TTSEGS_TTSEGS_DEVICE_TRANSFER_H_
#define TTSEGS_TTSEGS_DEVICE_TRANSFER_H_

#include <string>
#include <vector>

#include "cudamatrix/cu-array.h"
#include "cudamatrix/cu-matrix.h"
#include "ttsegs/batch-collate.h"

namespace ttsegs {

using kaldi::CuArray;
using kaldi::CuMatrix;

/// @addtogroup ttsegs
/// @{

/**
   Model inputs of a batch in device memory.  Three-dimensional batch fields
   are stacked by rows: mel is (N * C) by T_max with rows [n * C, (n + 1) * C)
   belonging to example n, pitch is (N * F) by T_max, prior is (N * T_max) by
   L_max.  Integer fields are flattened row-major, e.g. text has N * L_max
   entries.  Without a GPU (or when built without CUDA) the storage is in
   host memory, as everywhere in Kaldi.
*/
struct TtsBatchInputs {
  int32 num_examples;
  int32 max_text_length;
  int32 max_frames;
  int32 num_channels;
  int32 num_formants;

  CuArray<int32> text;
  CuArray<int32> input_lengths;
  CuMatrix<BaseFloat> mel;
  CuArray<int32> output_lengths;
  CuMatrix<BaseFloat> pitch;
  CuMatrix<BaseFloat> energy;        // N by T_max
  bool has_speakers;
  CuArray<int32> speakers;
  CuMatrix<BaseFloat> prior;
  std::vector<std::string> audio_paths;
  bool has_prosody;
  CuArray<int32> prosody;
  bool has_ds_mel;
  int32 ds_channels;
  CuMatrix<BaseFloat> ds_mel;        // (N * C) by T_ds_max
  CuArray<int32> ds_output_lengths;

  TtsBatchInputs(): num_examples(0), max_text_length(0), max_frames(0),
                    num_channels(0), num_formants(0), has_speakers(false),
                    has_prosody(false), has_ds_mel(false), ds_channels(0) { }
};

/// Training targets of a batch.
struct TtsBatchTargets {
  CuMatrix<BaseFloat> mel;
  CuArray<int32> input_lengths;
  CuArray<int32> output_lengths;
};

/// Copies "batch" to the current device and splits it into inputs and
/// targets.  Returns the total number of mel frames (sum of output lengths).
int64 TransferBatch(const TtsBatch &batch, TtsBatchInputs *inputs,
                    TtsBatchTargets *targets);

/// Selects the GPU the way Kaldi programs do; use_gpu is "yes", "no",
/// "optional" or "wait".  Does nothing when built without CUDA.
void SelectDevice(const std::string &use_gpu);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_DEVICE_TRANSFER_H_
