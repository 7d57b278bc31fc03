// ttsegsbin/tts-get-egs.cc

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
#include <set>

#include "base/kaldi-common.h"
#include "util/common-utils.h"
#include "ttsegs/example-loader.h"
#include "ttsegs/parallel-loader.h"

int main(int argc, char *argv[]) {
  try {
    using namespace kaldi;
    using namespace ttsegs;
    typedef kaldi::int32 int32;

    const char *usage =
        "Prepare TTS training examples (token ids, mel-spectrogram, pitch,\n"
        "energy, speaker, alignment prior and optional prosody labels and\n"
        "downsampled mel) from corpus lists.\n"
        "Usage:  tts-get-egs [options] <egs-wspecifier>\n"
        "e.g.:\n"
        " tts-get-egs --dataset-path=LJSpeech-1.1 \\\n"
        "   --corpus-lists=filelists/train.txt --symbol-table=symbols.txt \\\n"
        "   --num-threads=8 ark:train.egs\n";

    ParseOptions po(usage);
    TtsDatasetOptions dataset_opts;
    ParallelLoaderOptions loader_opts;
    int32 chunk_size = 64;
    dataset_opts.Register(&po);
    loader_opts.Register(&po);
    po.Register("chunk-size", &chunk_size,
                "Number of examples loaded at a time.");

    po.Read(argc, argv);

    if (po.NumArgs() != 1) {
      po.PrintUsage();
      exit(1);
    }
    if (chunk_size < 1)
      KALDI_ERR << "--chunk-size must be at least 1";

    std::string examples_wspecifier = po.GetArg(1);

    std::vector<CorpusEntry> entries;
    ReadTtsCorpus(dataset_opts, &entries);

    std::vector<std::string> keys(entries.size());
    std::set<std::string> seen_keys;
    for (size_t i = 0; i < entries.size(); i++) {
      keys[i] = UtteranceKey(dataset_opts.dataset_path, entries[i].mel_path);
      if (!seen_keys.insert(keys[i]).second)
        KALDI_ERR << "Duplicate utterance key " << keys[i] << " for "
                  << entries[i].mel_path;
    }

    DefaultTtsCollaborators collaborators(dataset_opts);
    ExampleLoader loader(dataset_opts, entries, collaborators.Get());
    ParallelExampleLoader parallel_loader(&loader, loader_opts);

    TtsExampleWriter example_writer(examples_wspecifier);

    int32 num_done = 0, num_err = 0;
    int64 num_frames = 0;
    for (int32 start = 0; start < loader.NumExamples(); start += chunk_size) {
      int32 end = std::min(start + chunk_size, loader.NumExamples());
      std::vector<int32> indices;
      for (int32 i = start; i < end; i++) indices.push_back(i);
      std::vector<TtsExample> examples;
      std::vector<std::string> errors;
      parallel_loader.LoadExamples(indices, &examples, &errors);
      for (size_t i = 0; i < indices.size(); i++) {
        const CorpusEntry &entry = loader.Entry(indices[i]);
        if (!errors[i].empty()) {
          KALDI_WARN << "Could not load " << entry.mel_path << ": "
                     << errors[i];
          num_err++;
          continue;
        }
        example_writer.Write(keys[indices[i]], examples[i]);
        num_frames += examples[i].NumFrames();
        num_done++;
      }
    }

    const InterpolatedPriorSource *interpolated =
        dynamic_cast<const InterpolatedPriorSource*>(&loader.PriorSource());
    if (interpolated != NULL)
      KALDI_LOG << "Alignment prior bank holds "
                << interpolated->Interpolator().BankSize() << " buckets.";
    const DiskCachedPriorSource *cached =
        dynamic_cast<const DiskCachedPriorSource*>(&loader.PriorSource());
    if (cached != NULL)
      KALDI_LOG << "Alignment priors: " << cached->NumCacheHits()
                << " read from cache, " << cached->NumComputed()
                << " computed.";
    KALDI_LOG << "Wrote " << num_done << " examples with " << num_frames
              << " frames; " << num_err << " failed.";
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
