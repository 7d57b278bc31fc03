// ttsegsbin/tts-merge-egs-to-batches.cc

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

#include "base/kaldi-common.h"
#include "util/common-utils.h"
#include "ttsegs/batch-collate.h"

int main(int argc, char *argv[]) {
  try {
    using namespace kaldi;
    using namespace ttsegs;
    typedef kaldi::int32 int32;

    const char *usage =
        "Collate TTS examples into padded batches.  Consecutive examples are\n"
        "grouped; within a batch examples are sorted by decreasing text\n"
        "length.\n"
        "Usage:  tts-merge-egs-to-batches [options] <egs-rspecifier> "
        "<batches-wspecifier>\n"
        "e.g.:\n"
        " tts-merge-egs-to-batches --batch-size=32 ark:train.egs "
        "ark:train.batches\n";

    ParseOptions po(usage);
    int32 batch_size = 16;
    bool drop_last = false;
    po.Register("batch-size", &batch_size, "Number of examples per batch.");
    po.Register("drop-last", &drop_last,
                "If true, do not write a final batch smaller than "
                "--batch-size.");

    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }
    if (batch_size < 1)
      KALDI_ERR << "--batch-size must be at least 1";

    std::string examples_rspecifier = po.GetArg(1),
        batches_wspecifier = po.GetArg(2);

    SequentialTtsExampleReader example_reader(examples_rspecifier);
    TtsBatchWriter batch_writer(batches_wspecifier);

    int32 num_examples = 0, num_batches = 0;
    std::vector<TtsExample> examples;
    std::string first_key;
    for (; ; example_reader.Next()) {
      bool done = example_reader.Done();
      if (!done) {
        if (examples.empty()) first_key = example_reader.Key();
        examples.resize(examples.size() + 1);
        examples.back().Swap(&example_reader.Value());
        num_examples++;
      }
      bool full = (static_cast<int32>(examples.size()) == batch_size);
      if (full || (done && !examples.empty() && !drop_last)) {
        TtsBatch batch;
        CollateExamples(examples, &batch);
        std::ostringstream key;
        key << first_key << "-" << num_batches;
        batch_writer.Write(key.str(), batch);
        num_batches++;
        examples.clear();
      }
      if (done) break;
    }
    if (!examples.empty())
      KALDI_LOG << "Dropped " << examples.size() << " examples of the last, "
                << "incomplete batch.";

    KALDI_LOG << "Merged " << num_examples << " examples into " << num_batches
              << " batches.";
    return (num_batches != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
