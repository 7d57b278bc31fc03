// ttsegsbin/tts-egs-info.cc

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

#include "base/kaldi-common.h"
#include "util/common-utils.h"
#include "ttsegs/batch-collate.h"
#include "ttsegs/device-transfer.h"

int main(int argc, char *argv[]) {
  try {
    using namespace kaldi;
    using namespace ttsegs;
    typedef kaldi::int32 int32;

    const char *usage =
        "Print the shapes of TTS examples, or with --batches=true of padded\n"
        "batches, which are also moved to the device to check that they can\n"
        "be fed to training.\n"
        "Usage:  tts-egs-info [options] <egs-or-batches-rspecifier>\n"
        "e.g.:\n"
        " tts-egs-info ark:train.egs\n"
        " tts-egs-info --batches=true --use-gpu=yes ark:train.batches\n";

    ParseOptions po(usage);
    bool batches = false;
    std::string use_gpu = "no";
    po.Register("batches", &batches, "If true, read batches, not examples.");
    po.Register("use-gpu", &use_gpu,
                "yes|no|optional|wait, only has effect if compiled with CUDA "
                "and --batches=true");

    po.Read(argc, argv);

    if (po.NumArgs() != 1) {
      po.PrintUsage();
      exit(1);
    }

    std::string rspecifier = po.GetArg(1);
    int32 num_read = 0;
    int64 num_frames = 0;

    if (!batches) {
      SequentialTtsExampleReader example_reader(rspecifier);
      for (; !example_reader.Done(); example_reader.Next()) {
        const TtsExample &eg = example_reader.Value();
        std::cout << example_reader.Key() << " tokens=" << eg.TextLength()
                  << " frames=" << eg.NumFrames()
                  << " channels=" << eg.mel.NumRows()
                  << " formants=" << eg.pitch.NumRows()
                  << " speaker=" << eg.speaker;
        if (eg.has_prosody) std::cout << " prosody";
        if (eg.has_ds_mel) std::cout << " ds-frames=" << eg.ds_mel.NumCols();
        std::cout << '\n';
        num_frames += eg.NumFrames();
        num_read++;
      }
      KALDI_LOG << "Read " << num_read << " examples with " << num_frames
                << " frames.";
    } else {
      SelectDevice(use_gpu);
      SequentialTtsBatchReader batch_reader(rspecifier);
      for (; !batch_reader.Done(); batch_reader.Next()) {
        const TtsBatch &batch = batch_reader.Value();
        TtsBatchInputs inputs;
        TtsBatchTargets targets;
        int64 batch_frames = TransferBatch(batch, &inputs, &targets);
        std::cout << batch_reader.Key() << " examples=" << inputs.num_examples
                  << " max-tokens=" << inputs.max_text_length
                  << " max-frames=" << inputs.max_frames
                  << " mel=" << inputs.mel.NumRows() << "x"
                  << inputs.mel.NumCols()
                  << " prior=" << inputs.prior.NumRows() << "x"
                  << inputs.prior.NumCols()
                  << " frames=" << batch_frames << '\n';
        num_frames += batch_frames;
        num_read++;
      }
      KALDI_LOG << "Read " << num_read << " batches with " << num_frames
                << " frames.";
    }
    return (num_read != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
