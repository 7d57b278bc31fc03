// ttsegs/text-encoder-test.cc

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

#include "ttsegs/text-encoder.h"
#include "ttsegs/word-label-upsample.h"

namespace ttsegs {

typedef std::map<std::string, std::vector<std::string> > Lexicon;

static void TestSymbols(std::map<std::string, int32> *symbols) {
  (*symbols)[" "] = 0;
  (*symbols)["a"] = 1;
  (*symbols)["b"] = 2;
  (*symbols)["c"] = 3;
  (*symbols)["."] = 4;
  (*symbols)["@AH0"] = 5;
  (*symbols)["@B"] = 6;
}

static int32 Sum(const std::vector<int32> &v) {
  int32 ans = 0;
  for (size_t i = 0; i < v.size(); i++) ans += v[i];
  return ans;
}

void UnitTestClean() {
  std::map<std::string, int32> symbols;
  TestSymbols(&symbols);
  SymbolTableTextEncoder encoder("basic_cleaners", symbols, Lexicon());
  KALDI_ASSERT(encoder.Clean("  Ab   C. ") == "ab c.");
  KALDI_ASSERT(encoder.Clean("{AH0  B} Ab") == "{AH0 B} ab");
  SymbolTableTextEncoder identity("identity", symbols, Lexicon());
  KALDI_ASSERT(identity.Clean(" Ab ") == " Ab ");
  KALDI_ASSERT(encoder.SpaceId() == 0 && encoder.NumSymbols() == 7);
}

void UnitTestEncode() {
  std::map<std::string, int32> symbols;
  TestSymbols(&symbols);
  SymbolTableTextEncoder encoder("basic_cleaners", symbols, Lexicon());
  std::vector<int32> ids, counts;

  encoder.Encode("Ab C.", &ids, &counts);
  KALDI_ASSERT(ids.size() == 5 && ids[0] == 1 && ids[1] == 2 &&
               ids[2] == 0 && ids[3] == 3 && ids[4] == 4);
  KALDI_ASSERT(counts.size() == 2 && counts[0] == 3 && counts[1] == 2);

  encoder.Encode("{AH0 B} a", &ids, &counts);
  KALDI_ASSERT(ids.size() == 4 && ids[0] == 5 && ids[1] == 6 &&
               ids[2] == 0 && ids[3] == 1);
  KALDI_ASSERT(counts.size() == 2 && Sum(counts) == 4);

  // unknown characters are dropped
  encoder.Encode("zaz", &ids, NULL);
  KALDI_ASSERT(ids.size() == 1 && ids[0] == 1);

  SymbolTableTextEncoder identity("identity", symbols, Lexicon());
  identity.Encode(" a", &ids, &counts);
  KALDI_ASSERT(ids.size() == 2 && ids[0] == 0 && ids[1] == 1);
  KALDI_ASSERT(counts.size() == 1 && counts[0] == 2);
}

void UnitTestLexicon() {
  std::map<std::string, int32> symbols;
  TestSymbols(&symbols);
  Lexicon lexicon;
  lexicon["ab"].push_back("AH0");
  lexicon["ab"].push_back("B");
  SymbolTableTextEncoder encoder("basic_cleaners", symbols, lexicon);
  std::vector<int32> ids, counts;
  encoder.Encode("Ab. c", &ids, &counts);
  KALDI_ASSERT(ids.size() == 5 && ids[0] == 5 && ids[1] == 6 &&
               ids[2] == 4 && ids[3] == 0 && ids[4] == 3);
  KALDI_ASSERT(counts.size() == 2 && counts[0] == 4 && counts[1] == 1);
}

void UnitTestMissingSpace() {
  std::map<std::string, int32> symbols;
  symbols["a"] = 0;
  bool threw = false;
  try {
    SymbolTableTextEncoder encoder("basic_cleaners", symbols, Lexicon());
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);

  TextEncoderOptions opts;
  opts.symbol_table = "symbols.txt";
  opts.p_arpabet = 0.5;
  threw = false;
  try {
    opts.Check();
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestUpsampleWordLabels() {
  std::map<std::string, int32> symbols;
  TestSymbols(&symbols);
  SymbolTableTextEncoder encoder("basic_cleaners", symbols, Lexicon());
  std::vector<int32> ids, counts, labels, token_labels;
  encoder.Encode("ab c. a", &ids, &counts);
  labels.push_back(2);
  labels.push_back(0);
  labels.push_back(1);
  RepeatWordLabelUpsampler upsampler;
  upsampler.Upsample(counts, labels, &token_labels);
  KALDI_ASSERT(token_labels.size() == ids.size());
  // "ab " -> 2, "c. " -> 0, "a" -> 1
  int32 expected[] = { 2, 2, 2, 0, 0, 0, 1 };
  for (size_t i = 0; i < token_labels.size(); i++)
    KALDI_ASSERT(token_labels[i] == expected[i]);

  labels.pop_back();
  bool threw = false;
  try {
    upsampler.Upsample(counts, labels, &token_labels);
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestClean();
  UnitTestEncode();
  UnitTestLexicon();
  UnitTestMissingSpace();
  UnitTestUpsampleWordLabels();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
