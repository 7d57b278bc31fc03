// ttsegs/word-label-upsample.cc

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

#include "ttsegs/word-label-upsample.h"

namespace ttsegs {

void RepeatWordLabelUpsampler::Upsample(const std::vector<int32> &word_counts,
                                        const std::vector<int32> &word_labels,
                                        std::vector<int32> *token_labels) const {
  if (word_counts.size() != word_labels.size())
    KALDI_ERR << "Number of word labels (" << word_labels.size()
              << ") does not match number of words (" << word_counts.size()
              << ")";
  token_labels->clear();
  for (size_t w = 0; w < word_counts.size(); w++) {
    KALDI_ASSERT(word_counts[w] >= 0);
    token_labels->insert(token_labels->end(), word_counts[w], word_labels[w]);
  }
}

void ReadWordLabels(const std::string &rxfilename,
                    std::vector<int32> *labels) {
  bool binary;
  kaldi::Input ki(rxfilename, &binary);
  kaldi::ReadIntegerVector(ki.Stream(), binary, labels);
}

}  // namespace ttsegs
