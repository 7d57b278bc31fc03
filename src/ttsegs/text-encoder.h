// ttsegs/text-encoder.h

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

#ifndef TTSEGS_TTSEGS_TEXT_ENCODER_H_
#define TTSEGS_TTSEGS_TEXT_ENCODER_H_

#include <map>
#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"

namespace ttsegs {

/// Converts a transcript to token ids.
class TextEncoder {
 public:
  /// Encodes "text" into "ids".  If "word_counts" is not NULL it receives the
  /// number of tokens contributed by each word, in order; the counts sum to
  /// ids->size().
  virtual void Encode(const std::string &text,
                      std::vector<int32> *ids,
                      std::vector<int32> *word_counts) const = 0;

  /// Id of the word separator (space) token.
  virtual int32 SpaceId() const = 0;

  virtual ~TextEncoder() { }
};


struct TextEncoderOptions {
  std::string cleaners;
  std::string symbol_table;
  std::string lexicon;
  BaseFloat p_arpabet;

  TextEncoderOptions(): cleaners("basic_cleaners"), p_arpabet(0.0) { }

  void Register(OptionsItf *opts) {
    opts->Register("text-cleaners", &cleaners,
                   "Text cleaning pipeline: basic_cleaners (lower-case and "
                   "collapse whitespace) or identity.");
    opts->Register("symbol-table", &symbol_table,
                   "Symbol table (rxfilename) with lines \"<symbol> <id>\"; "
                   "<space> stands for the space character and phones are "
                   "written with a leading @, e.g. @AH0.");
    opts->Register("lexicon", &lexicon,
                   "Pronunciation lexicon (rxfilename) with lines \"<word> "
                   "<phone1> <phone2> ...\"; used when --p-arpabet=1.");
    opts->Register("p-arpabet", &p_arpabet,
                   "Probability of replacing a word by its pronunciation. "
                   "Only 0 and 1 are supported, other values would make "
                   "cached priors depend on random choices.");
  }

  /// Throws if the options are invalid.
  void Check() const;
};


/// Default TextEncoder.  Characters are looked up one by one (UTF-8 aware);
/// text in curly braces is read as space-separated phones, each looked up as
/// "@" + phone.  With p_arpabet == 1 words found in the lexicon are replaced
/// by their phones.  Characters missing from the symbol table are dropped.
class SymbolTableTextEncoder: public TextEncoder {
 public:
  explicit SymbolTableTextEncoder(const TextEncoderOptions &opts);

  /// Constructs from an in-memory table, for tests; "lexicon" may be empty.
  SymbolTableTextEncoder(const std::string &cleaners,
                         const std::map<std::string, int32> &symbols,
                         const std::map<std::string,
                                        std::vector<std::string> > &lexicon);

  virtual void Encode(const std::string &text,
                      std::vector<int32> *ids,
                      std::vector<int32> *word_counts) const;

  virtual int32 SpaceId() const { return space_id_; }

  /// Applies the cleaning pipeline.
  std::string Clean(const std::string &text) const;

  int32 NumSymbols() const { return symbols_.size(); }

 private:
  void Init();
  // Appends the id of "symbol" if known; returns true if appended.
  bool AppendSymbol(const std::string &symbol, std::vector<int32> *ids) const;
  // Encodes one whitespace-free word.
  void EncodeWord(const std::string &word, std::vector<int32> *ids) const;

  std::string cleaners_;
  std::map<std::string, int32> symbols_;
  std::map<std::string, std::vector<std::string> > lexicon_;
  int32 space_id_;
};

/// Reads a symbol table in the format described for --symbol-table.
void ReadSymbolTable(const std::string &rxfilename,
                     std::map<std::string, int32> *symbols);

/// Reads a lexicon in the format described for --lexicon.  Words are stored
/// lower-cased; the first pronunciation of a word is kept.
void ReadLexicon(const std::string &rxfilename,
                 std::map<std::string, std::vector<std::string> > *lexicon);

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_TEXT_ENCODER_H_
