// ttsegs/parallel-loader-test.cc

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

#include <stdlib.h>
#include <sstream>

#include "ttsegs/feature-cache.h"
#include "ttsegs/parallel-loader.h"

namespace ttsegs {

// Writes "num_utts" utterances with disk mels and pitch under "dir"; the
// pitch of utterance "bad_utt" is one frame short.
static void WriteCorpus(const std::string &dir, int32 num_utts, int32 bad_utt,
                        std::vector<CorpusEntry> *entries) {
  entries->resize(num_utts);
  for (int32 i = 0; i < num_utts; i++) {
    std::ostringstream name;
    name << "utt" << i;
    int32 num_frames = 5 + i;
    Matrix<BaseFloat> mel(num_frames, 3);
    mel.SetRandn();
    Vector<BaseFloat> pitch(i == bad_utt ? num_frames - 1 : num_frames);
    pitch.Set(120.0);
    CorpusEntry &entry = (*entries)[i];
    entry.mel_path = dir + "/mels/" + name.str() + ".mat";
    entry.pitch_path = dir + "/pitch/" + name.str() + ".vec";
    entry.text = std::string(1 + i % 4, 'a');
    CreateParentDirectories(entry.mel_path);
    CreateParentDirectories(entry.pitch_path);
    kaldi::WriteKaldiObject(mel, entry.mel_path, true);
    kaldi::WriteKaldiObject(pitch, entry.pitch_path, true);
  }
}

void UnitTestParallelLoad(int32 num_threads) {
  char tmpl[] = "/tmp/parallel-loader-test.XXXXXX";
  char *dir = mkdtemp(tmpl);
  KALDI_ASSERT(dir != NULL);
  std::vector<CorpusEntry> entries;
  WriteCorpus(dir, 20, 13, &entries);

  std::map<std::string, int32> symbols;
  symbols[" "] = 0;
  symbols["a"] = 1;
  SymbolTableTextEncoder encoder(
      "basic_cleaners", symbols,
      std::map<std::string, std::vector<std::string> >());
  TtsCollaborators collaborators;
  collaborators.text_encoder = &encoder;
  TtsDatasetOptions opts;
  ExampleLoader loader(opts, entries, collaborators);

  ParallelLoaderOptions parallel_opts;
  parallel_opts.num_threads = num_threads;
  ParallelExampleLoader parallel_loader(&loader, parallel_opts);
  KALDI_ASSERT(parallel_loader.NumThreads() == num_threads);

  std::vector<int32> indices;
  for (int32 i = 19; i >= 0; i--)
    if (i != 13) indices.push_back(i);
  std::vector<TtsExample> egs;
  parallel_loader.LoadExamples(indices, &egs);
  KALDI_ASSERT(egs.size() == indices.size());
  for (size_t i = 0; i < indices.size(); i++) {
    KALDI_ASSERT(egs[i].audio_path == entries[indices[i]].mel_path);
    KALDI_ASSERT(egs[i].NumFrames() == 5 + indices[i]);
    KALDI_ASSERT(egs[i].TextLength() == 1 + indices[i] % 4);
  }

  indices.push_back(13);
  indices.push_back(25);
  bool threw = false;
  try {
    parallel_loader.LoadExamples(indices, &egs);
  } catch (const std::exception &e) {
    threw = true;
    KALDI_ASSERT(std::string(e.what()).find("example 13") !=
                 std::string::npos);
  }
  KALDI_ASSERT(threw);

  std::vector<std::string> errors;
  parallel_loader.LoadExamples(indices, &egs, &errors);
  KALDI_ASSERT(errors.size() == indices.size());
  for (size_t i = 0; i + 2 < indices.size(); i++)
    KALDI_ASSERT(errors[i].empty());
  KALDI_ASSERT(!errors[indices.size() - 2].empty() &&
               !errors[indices.size() - 1].empty());
  KALDI_ASSERT(egs[0].NumFrames() == 24);

  std::string cmd = std::string("rm -r ") + dir;
  if (system(cmd.c_str()) != 0)
    KALDI_WARN << "Could not remove " << dir;
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestParallelLoad(1);
  UnitTestParallelLoad(4);
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
