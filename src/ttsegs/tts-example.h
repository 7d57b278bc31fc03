// ttsegs/tts-example.h

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

#ifndef TTSEGS_TTSEGS_TTS_EXAMPLE_H_
#define TTSEGS_TTSEGS_TTS_EXAMPLE_H_

#include <string>
#include <vector>

#include "ttsegs/ttsegs-common.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

/**
   One training example.  With L text tokens and T mel frames:
     text     L token ids
     mel      C by T
     pitch    F by T (F formants, usually 1)
     energy   T
     prior    T by L
   plus the optional per-token prosody labels (L) and the optional
   downsampled mel (C by T_ds).
*/
struct TtsExample {
  std::vector<int32> text;
  Matrix<BaseFloat> mel;
  Matrix<BaseFloat> pitch;
  Vector<BaseFloat> energy;
  /// -1 if the corpus has no speaker column.
  int32 speaker;
  Matrix<BaseFloat> prior;
  std::string audio_path;

  bool has_prosody;
  std::vector<int32> prosody;

  bool has_ds_mel;
  Matrix<BaseFloat> ds_mel;

  TtsExample(): speaker(-1), has_prosody(false), has_ds_mel(false) { }

  int32 TextLength() const { return text.size(); }
  int32 NumFrames() const { return mel.NumCols(); }
  bool HasSpeaker() const { return speaker >= 0; }

  /// Throws if the shapes of the fields are inconsistent.
  void Check() const;

  void Write(std::ostream &os, bool binary) const;
  void Read(std::istream &is, bool binary);

  void Swap(TtsExample *other);
};

typedef kaldi::TableWriter<kaldi::KaldiObjectHolder<TtsExample> >
    TtsExampleWriter;
typedef kaldi::SequentialTableReader<kaldi::KaldiObjectHolder<TtsExample> >
    SequentialTtsExampleReader;
typedef kaldi::RandomAccessTableReader<kaldi::KaldiObjectHolder<TtsExample> >
    RandomAccessTtsExampleReader;

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_TTS_EXAMPLE_H_
