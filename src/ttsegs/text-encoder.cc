// ttsegs/text-encoder.cc

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
#include <cctype>
#include <set>

#include "ttsegs/text-encoder.h"

namespace ttsegs {

static const char *kSpaceSymbol = "<space>";
static const char *kPunctuation = "!'\",.:;?()-";

void TextEncoderOptions::Check() const {
  if (p_arpabet != 0.0 && p_arpabet != 1.0)
    KALDI_ERR << "--p-arpabet must be 0 or 1, got " << p_arpabet
              << "; other values break caching of alignment priors.";
  if (p_arpabet == 1.0 && lexicon.empty())
    KALDI_ERR << "--p-arpabet=1 requires --lexicon";
  if (symbol_table.empty())
    KALDI_ERR << "--symbol-table must be given";
  if (cleaners != "basic_cleaners" && cleaners != "identity")
    KALDI_ERR << "Unknown text cleaners '" << cleaners << "'";
}

void ReadSymbolTable(const std::string &rxfilename,
                     std::map<std::string, int32> *symbols) {
  symbols->clear();
  kaldi::Input ki(rxfilename);
  std::set<int32> ids;
  std::string line;
  int32 line_number = 0;
  while (std::getline(ki.Stream(), line)) {
    line_number++;
    std::vector<std::string> fields;
    kaldi::SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    int32 id;
    if (fields.size() != 2 || !kaldi::ConvertStringToInteger(fields[1], &id) ||
        id < 0)
      KALDI_ERR << "Bad line " << line_number << " in symbol table "
                << rxfilename << ": " << line;
    std::string symbol = (fields[0] == kSpaceSymbol ? " " : fields[0]);
    if (symbols->count(symbol) != 0 || ids.count(id) != 0)
      KALDI_ERR << "Duplicate symbol or id on line " << line_number
                << " of " << rxfilename << ": " << line;
    (*symbols)[symbol] = id;
    ids.insert(id);
  }
}

void ReadLexicon(const std::string &rxfilename,
                 std::map<std::string, std::vector<std::string> > *lexicon) {
  lexicon->clear();
  kaldi::Input ki(rxfilename);
  std::string line;
  while (std::getline(ki.Stream(), line)) {
    std::vector<std::string> fields;
    kaldi::SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.size() < 2) continue;
    std::string word = fields[0];
    for (size_t i = 0; i < word.size(); i++)
      word[i] = std::tolower(static_cast<unsigned char>(word[i]));
    if (lexicon->count(word) != 0) continue;
    (*lexicon)[word].assign(fields.begin() + 1, fields.end());
  }
  KALDI_VLOG(1) << "Read " << lexicon->size() << " words from " << rxfilename;
}


SymbolTableTextEncoder::SymbolTableTextEncoder(const TextEncoderOptions &opts):
    cleaners_(opts.cleaners), space_id_(-1) {
  opts.Check();
  ReadSymbolTable(opts.symbol_table, &symbols_);
  if (opts.p_arpabet == 1.0)
    ReadLexicon(opts.lexicon, &lexicon_);
  Init();
}

SymbolTableTextEncoder::SymbolTableTextEncoder(
    const std::string &cleaners,
    const std::map<std::string, int32> &symbols,
    const std::map<std::string, std::vector<std::string> > &lexicon):
    cleaners_(cleaners), symbols_(symbols), lexicon_(lexicon), space_id_(-1) {
  Init();
}

void SymbolTableTextEncoder::Init() {
  std::map<std::string, int32>::const_iterator iter = symbols_.find(" ");
  if (iter == symbols_.end())
    KALDI_ERR << "The symbol table has no " << kSpaceSymbol << " symbol.";
  space_id_ = iter->second;
}

std::string SymbolTableTextEncoder::Clean(const std::string &text) const {
  if (cleaners_ == "identity")
    return text;
  std::string ans;
  bool in_braces = false, pending_space = false;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      continue;
    }
    if (pending_space && !ans.empty()) ans += ' ';
    pending_space = false;
    if (c == '{') in_braces = true;
    else if (c == '}') in_braces = false;
    if (!in_braces && (static_cast<unsigned char>(c) < 128))
      c = std::tolower(static_cast<unsigned char>(c));
    ans += c;
  }
  return ans;
}

bool SymbolTableTextEncoder::AppendSymbol(const std::string &symbol,
                                          std::vector<int32> *ids) const {
  std::map<std::string, int32>::const_iterator iter = symbols_.find(symbol);
  if (iter == symbols_.end()) {
    KALDI_VLOG(3) << "Dropping unknown symbol '" << symbol << "'";
    return false;
  }
  ids->push_back(iter->second);
  return true;
}

// Length of the UTF-8 sequence that starts with byte "c".
static inline size_t Utf8Length(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xe) return 3;
  if ((c >> 3) == 0x1e) return 4;
  return 1;
}

void SymbolTableTextEncoder::EncodeWord(const std::string &word,
                                        std::vector<int32> *ids) const {
  size_t begin = 0, end = word.size();
  if (!lexicon_.empty()) {
    begin = word.find_first_not_of(kPunctuation);
    size_t last = word.find_last_not_of(kPunctuation);
    if (begin == std::string::npos) {
      begin = end;
    } else {
      end = last + 1;
      std::string key = word.substr(begin, end - begin);
      for (size_t i = 0; i < key.size(); i++)
        key[i] = std::tolower(static_cast<unsigned char>(key[i]));
      std::map<std::string, std::vector<std::string> >::const_iterator
          iter = lexicon_.find(key);
      if (iter != lexicon_.end()) {
        for (size_t i = 0; i < begin; i++)
          AppendSymbol(word.substr(i, 1), ids);
        for (size_t i = 0; i < iter->second.size(); i++)
          AppendSymbol("@" + iter->second[i], ids);
        for (size_t i = end; i < word.size(); i++)
          AppendSymbol(word.substr(i, 1), ids);
        return;
      }
    }
  }
  for (size_t i = 0; i < word.size(); ) {
    size_t len = std::min(Utf8Length(word[i]), word.size() - i);
    AppendSymbol(word.substr(i, len), ids);
    i += len;
  }
}

void SymbolTableTextEncoder::Encode(const std::string &text,
                                    std::vector<int32> *ids,
                                    std::vector<int32> *word_counts) const {
  ids->clear();
  if (word_counts != NULL) word_counts->clear();
  std::string cleaned = Clean(text);

  // Tokens are attributed to the current word; a space closes the word it
  // follows, and spaces before the first word belong to that word.
  size_t word_start = 0;
  bool word_has_content = false;
  size_t i = 0;
  while (i < cleaned.size()) {
    char c = cleaned[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ids->push_back(space_id_);
      i++;
      if (word_has_content) {
        if (word_counts != NULL)
          word_counts->push_back(ids->size() - word_start);
        word_start = ids->size();
        word_has_content = false;
      }
    } else if (c == '{') {
      size_t close = cleaned.find('}', i);
      if (close == std::string::npos) close = cleaned.size();
      std::vector<std::string> phones;
      kaldi::SplitStringToVector(cleaned.substr(i + 1, close - i - 1), " \t",
                                 true, &phones);
      for (size_t p = 0; p < phones.size(); p++)
        if (AppendSymbol("@" + phones[p], ids)) word_has_content = true;
      i = close + 1;
    } else {
      size_t stop = i;
      while (stop < cleaned.size() && cleaned[stop] != '{' &&
             !std::isspace(static_cast<unsigned char>(cleaned[stop])))
        stop++;
      size_t before = ids->size();
      EncodeWord(cleaned.substr(i, stop - i), ids);
      if (ids->size() > before) word_has_content = true;
      i = stop;
    }
  }
  if (word_counts != NULL && ids->size() > word_start) {
    int32 remainder = ids->size() - word_start;
    if (word_has_content || word_counts->empty())
      word_counts->push_back(remainder);
    else
      word_counts->back() += remainder;
  }
}

}  // namespace ttsegs
