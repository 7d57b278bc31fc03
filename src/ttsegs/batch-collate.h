// ttsegs/batch-collate.h

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

#ifndef TTSEGS_TTSEGS_BATCH_COLLATE_H_
#define TTSEGS_TTSEGS_BATCH_COLLATE_H_

#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"
#include "ttsegs/tts-example.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

/**
   A padded batch of N examples, sorted by decreasing text length.  All
   padding is zero and every example is left-aligned.  Row r of every field
   belongs to the same example, which was element sort_order[r] of the
   collated list.
*/
struct TtsBatch {
  std::vector<std::vector<int32> > text;      // N of L_max
  std::vector<Matrix<BaseFloat> > mel;        // N of C by T_max
  std::vector<Matrix<BaseFloat> > pitch;      // N of F by T_max
  Matrix<BaseFloat> energy;                   // N by T_max
  std::vector<Matrix<BaseFloat> > prior;      // N of T_max by L_max

  bool has_speakers;
  std::vector<int32> speakers;                // N

  bool has_prosody;
  std::vector<std::vector<int32> > prosody;   // N of L_max

  bool has_ds_mel;
  std::vector<Matrix<BaseFloat> > ds_mel;     // N of C by T_ds_max
  std::vector<int32> ds_output_lengths;       // N

  std::vector<int32> input_lengths;           // text lengths
  std::vector<int32> output_lengths;          // mel frames
  std::vector<int32> token_counts;            // tokens per example
  std::vector<int32> sort_order;
  std::vector<std::string> audio_paths;

  TtsBatch(): has_speakers(false), has_prosody(false), has_ds_mel(false) { }

  int32 NumExamples() const { return text.size(); }
  int32 MaxTextLength() const { return text.empty() ? 0 : text[0].size(); }
  int32 MaxFrames() const { return energy.NumCols(); }
  /// Sum of output_lengths.
  int64 TotalFrames() const;

  void Write(std::ostream &os, bool binary) const;
  void Read(std::istream &is, bool binary);
};

typedef kaldi::TableWriter<kaldi::KaldiObjectHolder<TtsBatch> >
    TtsBatchWriter;
typedef kaldi::SequentialTableReader<kaldi::KaldiObjectHolder<TtsBatch> >
    SequentialTtsBatchReader;

/// Sorts "examples" by text length (descending, ties keep their order) and
/// pads them into "batch".  The presence of speakers, prosody labels and
/// downsampled mels must be the same for all examples, as must the number of
/// mel channels and pitch formants; otherwise this throws.
void CollateExamples(const std::vector<TtsExample> &examples,
                     TtsBatch *batch);

/// Recovers example "row" of "batch" without its padding.
void UnpadExample(const TtsBatch &batch, int32 row, TtsExample *eg);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_BATCH_COLLATE_H_
