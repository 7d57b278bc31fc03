// ttsegs/word-label-upsample.h

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

#ifndef TTSEGS_TTSEGS_WORD_LABEL_UPSAMPLE_H_
#define TTSEGS_TTSEGS_WORD_LABEL_UPSAMPLE_H_

#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"

namespace ttsegs {

/// Maps word-level prosody labels (e.g. CWT accent classes) to token level.
class WordLabelUpsampler {
 public:
  /// "word_counts" holds the number of tokens of each word (as produced by
  /// TextEncoder::Encode) and "word_labels" one label per word.
  virtual void Upsample(const std::vector<int32> &word_counts,
                        const std::vector<int32> &word_labels,
                        std::vector<int32> *token_labels) const = 0;
  virtual ~WordLabelUpsampler() { }
};

/// Gives every token the label of its word.  The number of labels must equal
/// the number of words.
class RepeatWordLabelUpsampler: public WordLabelUpsampler {
 public:
  virtual void Upsample(const std::vector<int32> &word_counts,
                        const std::vector<int32> &word_labels,
                        std::vector<int32> *token_labels) const;
};

/// Reads per-word labels stored as a Kaldi integer vector (text or binary).
void ReadWordLabels(const std::string &rxfilename,
                    std::vector<int32> *labels);

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_WORD_LABEL_UPSAMPLE_H_
