// ttsegs/tts-corpus.cc

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
#include <sstream>

#include "ttsegs/feature-cache.h"
#include "ttsegs/tts-corpus.h"

namespace ttsegs {

void ParseCorpusColumns(const std::string &layout,
                        std::vector<CorpusColumn> *columns) {
  std::vector<std::string> names;
  kaldi::SplitStringToVector(layout, ",", true, &names);
  columns->clear();
  for (size_t i = 0; i < names.size(); i++) {
    std::string name = names[i];
    kaldi::Trim(&name);
    CorpusColumn col;
    if (name == "mels") col = kMelsColumn;
    else if (name == "pitch") col = kPitchColumn;
    else if (name == "text") col = kTextColumn;
    else if (name == "speaker") col = kSpeakerColumn;
    else if (name == "cwt") col = kCwtColumn;
    else if (name == "mels_ds") col = kMelsDsColumn;
    else
      KALDI_ERR << "Unknown corpus column '" << name << "' in '" << layout
                << "'";
    if (std::find(columns->begin(), columns->end(), col) != columns->end())
      KALDI_ERR << "Corpus column '" << name << "' given twice in '" << layout
                << "'";
    columns->push_back(col);
  }
  if (std::find(columns->begin(), columns->end(), kMelsColumn) ==
      columns->end() ||
      std::find(columns->begin(), columns->end(), kTextColumn) ==
      columns->end())
    KALDI_ERR << "Corpus columns '" << layout << "' must include mels and text";
}

void DefaultCorpusColumns(bool has_pitch, bool has_cwt, bool has_mels_ds,
                          bool has_speaker,
                          std::vector<CorpusColumn> *columns) {
  columns->clear();
  columns->push_back(kMelsColumn);
  if (has_pitch) columns->push_back(kPitchColumn);
  if (has_cwt) columns->push_back(kCwtColumn);
  if (has_mels_ds) columns->push_back(kMelsDsColumn);
  columns->push_back(kTextColumn);
  if (has_speaker) columns->push_back(kSpeakerColumn);
}

std::string ResolveDatasetPath(const std::string &dataset_path,
                               const std::string &path) {
  if (dataset_path.empty() || path.empty() || path[0] == '/')
    return path;
  if (dataset_path[dataset_path.size() - 1] == '/')
    return dataset_path + path;
  return dataset_path + "/" + path;
}

bool ParseCorpusLine(const std::string &line,
                     const std::vector<CorpusColumn> &columns,
                     const std::string &dataset_path,
                     CorpusEntry *entry, std::string *error) {
  std::vector<std::string> fields;
  kaldi::SplitStringToVector(line, "|", false, &fields);
  size_t num_cols = columns.size();
  if (fields.size() < num_cols) {
    std::ostringstream os;
    os << "expected " << num_cols << " fields, got " << fields.size();
    *error = os.str();
    return false;
  }
  size_t surplus = fields.size() - num_cols;

  *entry = CorpusEntry();
  size_t f = 0;
  for (size_t c = 0; c < num_cols; c++) {
    std::string value = fields[f++];
    if (columns[c] == kTextColumn) {
      for (size_t s = 0; s < surplus; s++)
        value += "|" + fields[f++];
      entry->text = value;
      continue;
    }
    kaldi::Trim(&value);
    if (value.empty()) {
      *error = "empty field";
      return false;
    }
    switch (columns[c]) {
      case kMelsColumn:
        entry->mel_path = ResolveDatasetPath(dataset_path, value);
        break;
      case kPitchColumn:
        entry->pitch_path = ResolveDatasetPath(dataset_path, value);
        break;
      case kCwtColumn:
        entry->cwt_path = ResolveDatasetPath(dataset_path, value);
        break;
      case kMelsDsColumn:
        entry->ds_mel_path = ResolveDatasetPath(dataset_path, value);
        break;
      case kSpeakerColumn:
        if (!kaldi::ConvertStringToInteger(value, &(entry->speaker)) ||
            entry->speaker < 0) {
          *error = "invalid speaker id '" + value + "'";
          return false;
        }
        break;
      default:
        KALDI_ERR << "Unhandled corpus column " << columns[c];
    }
  }
  if (surplus > 0 &&
      std::find(columns.begin(), columns.end(), kTextColumn) == columns.end()) {
    *error = "too many fields";
    return false;
  }
  return true;
}

std::string UtteranceKey(const std::string &dataset_path,
                         const std::string &audio_path) {
  std::string rel = ReplaceExtension(RelativeToDataset(dataset_path,
                                                       audio_path), "");
  size_t start = rel.find_first_not_of('/');
  if (start == std::string::npos)
    KALDI_ERR << "Cannot derive an utterance key from '" << audio_path << "'";
  std::string key = rel.substr(start);
  for (size_t i = 0; i < key.size(); i++)
    if (key[i] == '/' || std::isspace(static_cast<unsigned char>(key[i])))
      key[i] = '-';
  return key;
}

void ReadCorpusLists(const std::vector<std::string> &corpus_lists,
                     const std::vector<CorpusColumn> &columns,
                     const std::string &dataset_path,
                     std::vector<CorpusEntry> *entries) {
  entries->clear();
  for (size_t i = 0; i < corpus_lists.size(); i++) {
    kaldi::Input ki(corpus_lists[i]);
    std::string line, error;
    int32 line_number = 0;
    while (std::getline(ki.Stream(), line)) {
      line_number++;
      std::string trimmed(line);
      kaldi::Trim(&trimmed);
      if (trimmed.empty()) continue;
      CorpusEntry entry;
      if (!ParseCorpusLine(trimmed, columns, dataset_path, &entry, &error))
        KALDI_ERR << "Bad line " << line_number << " in corpus list "
                  << corpus_lists[i] << ": " << error << ": " << line;
      entries->push_back(entry);
    }
    KALDI_VLOG(1) << "Read " << line_number << " lines from " << corpus_lists[i];
  }
  KALDI_LOG << "Corpus has " << entries->size() << " entries.";
}

}  // namespace ttsegs
