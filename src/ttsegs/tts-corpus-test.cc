// ttsegs/tts-corpus-test.cc

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
#include <unistd.h>
#include <fstream>

#include "ttsegs/tts-corpus.h"

namespace ttsegs {

static bool ColumnsThrow(const std::string &layout) {
  std::vector<CorpusColumn> columns;
  try {
    ParseCorpusColumns(layout, &columns);
  } catch (const std::exception &) {
    return true;
  }
  return false;
}

void UnitTestCorpusColumns() {
  std::vector<CorpusColumn> columns;
  ParseCorpusColumns("mels, pitch,text,speaker", &columns);
  KALDI_ASSERT(columns.size() == 4 && columns[0] == kMelsColumn &&
               columns[1] == kPitchColumn && columns[2] == kTextColumn &&
               columns[3] == kSpeakerColumn);
  KALDI_ASSERT(ColumnsThrow("mels,pitch"));
  KALDI_ASSERT(ColumnsThrow("text,pitch"));
  KALDI_ASSERT(ColumnsThrow("mels,text,text"));
  KALDI_ASSERT(ColumnsThrow("mels,text,energy"));

  DefaultCorpusColumns(true, true, true, true, &columns);
  KALDI_ASSERT(columns.size() == 6 && columns[0] == kMelsColumn &&
               columns[1] == kPitchColumn && columns[2] == kCwtColumn &&
               columns[3] == kMelsDsColumn && columns[4] == kTextColumn &&
               columns[5] == kSpeakerColumn);
  DefaultCorpusColumns(false, false, false, false, &columns);
  KALDI_ASSERT(columns.size() == 2 && columns[0] == kMelsColumn &&
               columns[1] == kTextColumn);
}

void UnitTestParseCorpusLine() {
  std::vector<CorpusColumn> columns;
  ParseCorpusColumns("mels,pitch,text,speaker", &columns);
  CorpusEntry entry;
  std::string error;
  KALDI_ASSERT(ParseCorpusLine("mels/a.mat|/abs/pitch/a.mat|Hello, world.|3",
                               columns, "/data", &entry, &error));
  KALDI_ASSERT(entry.mel_path == "/data/mels/a.mat");
  KALDI_ASSERT(entry.pitch_path == "/abs/pitch/a.mat");
  KALDI_ASSERT(entry.text == "Hello, world.");
  KALDI_ASSERT(entry.speaker == 3);
  KALDI_ASSERT(entry.cwt_path.empty() && entry.ds_mel_path.empty());

  // "|" inside the transcript
  KALDI_ASSERT(ParseCorpusLine("a.mat|p.mat|one|two|0", columns, "", &entry,
                               &error));
  KALDI_ASSERT(entry.text == "one|two" && entry.speaker == 0);

  KALDI_ASSERT(!ParseCorpusLine("a.mat|p.mat|text", columns, "", &entry,
                                &error));
  KALDI_ASSERT(!error.empty());
  KALDI_ASSERT(!ParseCorpusLine("a.mat|p.mat|text|x", columns, "", &entry,
                                &error));
  KALDI_ASSERT(!ParseCorpusLine("|p.mat|text|1", columns, "", &entry,
                                &error));

  ParseCorpusColumns("mels,text", &columns);
  KALDI_ASSERT(ParseCorpusLine("wavs/a.wav|Text", columns, "/d/", &entry,
                               &error));
  KALDI_ASSERT(entry.mel_path == "/d/wavs/a.wav" && entry.speaker == -1);
}

void UnitTestUtteranceKey() {
  KALDI_ASSERT(UtteranceKey("/data/LJ", "/data/LJ/wavs/LJ001-0001.wav") ==
               "wavs-LJ001-0001");
  // same file name for two speakers
  KALDI_ASSERT(UtteranceKey("/vctk/", "/vctk/spk1/wavs/001.wav") !=
               UtteranceKey("/vctk/", "/vctk/spk2/wavs/001.wav"));
  KALDI_ASSERT(UtteranceKey("", "/abs/mels/a b.mat") == "abs-mels-a-b");
  KALDI_ASSERT(UtteranceKey("/d", "x.y/utt") == "x.y-utt");
  bool threw = false;
  try {
    UtteranceKey("/data/LJ", "/elsewhere/a.wav");
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestReadCorpusLists() {
  char tmpl[] = "/tmp/tts-corpus-test.XXXXXX";
  char *dir = mkdtemp(tmpl);
  KALDI_ASSERT(dir != NULL);
  std::string list1 = std::string(dir) + "/a.txt",
      list2 = std::string(dir) + "/b.txt";
  {
    std::ofstream os(list1.c_str());
    os << "wavs/1.wav|First one.\n\nwavs/2.wav|Second.\n";
    std::ofstream os2(list2.c_str());
    os2 << "wavs/3.wav|Third.\n";
  }
  std::vector<std::string> lists;
  lists.push_back(list1);
  lists.push_back(list2);
  std::vector<CorpusColumn> columns;
  DefaultCorpusColumns(false, false, false, false, &columns);
  std::vector<CorpusEntry> entries;
  ReadCorpusLists(lists, columns, "/ds", &entries);
  KALDI_ASSERT(entries.size() == 3);
  KALDI_ASSERT(entries[0].mel_path == "/ds/wavs/1.wav");
  KALDI_ASSERT(entries[2].text == "Third.");

  {
    std::ofstream os(list2.c_str());
    os << "wavs/3.wav\n";
  }
  bool threw = false;
  try {
    ReadCorpusLists(lists, columns, "/ds", &entries);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
  unlink(list1.c_str());
  unlink(list2.c_str());
  rmdir(dir);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestCorpusColumns();
  UnitTestParseCorpusLine();
  UnitTestUtteranceKey();
  UnitTestReadCorpusLists();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
