// ttsegs/tts-corpus.h

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

#ifndef TTSEGS_TTSEGS_TTS_CORPUS_H_
#define TTSEGS_TTSEGS_TTS_CORPUS_H_

#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"

namespace ttsegs {

/// One line of a corpus list.  Paths are already resolved against the
/// dataset directory.  Optional fields are empty (or -1 for the speaker).
struct CorpusEntry {
  std::string mel_path;     // mel matrix, or waveform if mels are computed
  std::string text;
  int32 speaker;
  std::string pitch_path;
  std::string cwt_path;     // per-word prosody labels
  std::string ds_mel_path;  // downsampled mel, or its waveform

  CorpusEntry(): speaker(-1) { }
};

enum CorpusColumn {
  kMelsColumn,
  kPitchColumn,
  kTextColumn,
  kSpeakerColumn,
  kCwtColumn,
  kMelsDsColumn
};

/// Parses a comma-separated list of column names ("mels", "pitch", "text",
/// "speaker", "cwt", "mels_ds").  "mels" and "text" are required and no name
/// may appear twice; throws otherwise.
void ParseCorpusColumns(const std::string &layout,
                        std::vector<CorpusColumn> *columns);

/// The layout used when none is given:
///   mels[,pitch][,cwt][,mels_ds],text[,speaker]
void DefaultCorpusColumns(bool has_pitch, bool has_cwt, bool has_mels_ds,
                          bool has_speaker,
                          std::vector<CorpusColumn> *columns);

/// Joins "path" to "dataset_path" unless it is absolute or dataset_path is
/// empty.
std::string ResolveDatasetPath(const std::string &dataset_path,
                               const std::string &path);

/// Parses one "|"-separated line.  If the line has more fields than there
/// are columns, the surplus fields are taken to be part of the transcript
/// (which may itself contain "|").  Returns false with a message in *error if
/// the line is malformed.
bool ParseCorpusLine(const std::string &line,
                     const std::vector<CorpusColumn> &columns,
                     const std::string &dataset_path,
                     CorpusEntry *entry, std::string *error);

/// Archive key of an utterance: its audio path relative to "dataset_path"
/// without extension, with "/" and whitespace replaced by "-", e.g.
/// "spk1/wavs/001.wav" -> "spk1-wavs-001".  Distinct files inside the
/// dataset get distinct keys.
std::string UtteranceKey(const std::string &dataset_path,
                         const std::string &audio_path);

/// Reads and concatenates the corpus lists (rxfilenames); empty lines are
/// skipped.  Throws on the first malformed line.
void ReadCorpusLists(const std::vector<std::string> &corpus_lists,
                     const std::vector<CorpusColumn> &columns,
                     const std::string &dataset_path,
                     std::vector<CorpusEntry> *entries);

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_TTS_CORPUS_H_
