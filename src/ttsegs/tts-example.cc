// ttsegs/tts-example.cc

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

#include <utility>

#include "ttsegs/tts-example.h"

namespace ttsegs {

void TtsExample::Check() const {
  int32 num_frames = NumFrames(), text_len = TextLength();
  if (pitch.NumCols() != num_frames)
    KALDI_ERR << "Pitch has " << pitch.NumCols() << " frames, mel has "
              << num_frames << " (" << audio_path << ")";
  if (pitch.NumRows() < 1 && num_frames > 0)
    KALDI_ERR << "Pitch has no formants (" << audio_path << ")";
  if (energy.Dim() != num_frames)
    KALDI_ERR << "Energy has " << energy.Dim() << " frames, mel has "
              << num_frames << " (" << audio_path << ")";
  if (prior.NumRows() != num_frames || prior.NumCols() != text_len)
    KALDI_ERR << "Alignment prior is " << prior.NumRows() << " by "
              << prior.NumCols() << ", expected " << num_frames << " by "
              << text_len << " (" << audio_path << ")";
  if (has_prosody && static_cast<int32>(prosody.size()) != text_len)
    KALDI_ERR << "Got " << prosody.size() << " prosody labels for "
              << text_len << " tokens (" << audio_path << ")";
}

void TtsExample::Write(std::ostream &os, bool binary) const {
  kaldi::WriteToken(os, binary, "<TtsExample>");
  kaldi::WriteToken(os, binary, "<Text>");
  kaldi::WriteIntegerVector(os, binary, text);
  kaldi::WriteToken(os, binary, "<Mel>");
  mel.Write(os, binary);
  kaldi::WriteToken(os, binary, "<Pitch>");
  pitch.Write(os, binary);
  kaldi::WriteToken(os, binary, "<Energy>");
  energy.Write(os, binary);
  kaldi::WriteToken(os, binary, "<Speaker>");
  kaldi::WriteBasicType(os, binary, speaker);
  kaldi::WriteToken(os, binary, "<Prior>");
  prior.Write(os, binary);
  if (!audio_path.empty()) {
    // tokens cannot contain whitespace; WriteToken() throws if it does
    kaldi::WriteToken(os, binary, "<AudioPath>");
    kaldi::WriteToken(os, binary, audio_path);
  }
  if (has_prosody) {
    kaldi::WriteToken(os, binary, "<Prosody>");
    kaldi::WriteIntegerVector(os, binary, prosody);
  }
  if (has_ds_mel) {
    kaldi::WriteToken(os, binary, "<DsMel>");
    ds_mel.Write(os, binary);
  }
  kaldi::WriteToken(os, binary, "</TtsExample>");
}

void TtsExample::Read(std::istream &is, bool binary) {
  kaldi::ExpectToken(is, binary, "<TtsExample>");
  kaldi::ExpectToken(is, binary, "<Text>");
  kaldi::ReadIntegerVector(is, binary, &text);
  kaldi::ExpectToken(is, binary, "<Mel>");
  mel.Read(is, binary);
  kaldi::ExpectToken(is, binary, "<Pitch>");
  pitch.Read(is, binary);
  kaldi::ExpectToken(is, binary, "<Energy>");
  energy.Read(is, binary);
  kaldi::ExpectToken(is, binary, "<Speaker>");
  kaldi::ReadBasicType(is, binary, &speaker);
  kaldi::ExpectToken(is, binary, "<Prior>");
  prior.Read(is, binary);
  audio_path.clear();
  has_prosody = false;
  prosody.clear();
  has_ds_mel = false;
  ds_mel.Resize(0, 0);
  std::string token;
  while (true) {
    kaldi::ReadToken(is, binary, &token);
    if (token == "</TtsExample>") {
      break;
    } else if (token == "<AudioPath>") {
      kaldi::ReadToken(is, binary, &audio_path);
    } else if (token == "<Prosody>") {
      has_prosody = true;
      kaldi::ReadIntegerVector(is, binary, &prosody);
    } else if (token == "<DsMel>") {
      has_ds_mel = true;
      ds_mel.Read(is, binary);
    } else {
      KALDI_ERR << "Unexpected token " << token << " in TtsExample";
    }
  }
}

void TtsExample::Swap(TtsExample *other) {
  text.swap(other->text);
  mel.Swap(&other->mel);
  pitch.Swap(&other->pitch);
  energy.Swap(&other->energy);
  std::swap(speaker, other->speaker);
  prior.Swap(&other->prior);
  audio_path.swap(other->audio_path);
  std::swap(has_prosody, other->has_prosody);
  prosody.swap(other->prosody);
  std::swap(has_ds_mel, other->has_ds_mel);
  ds_mel.Swap(&other->ds_mel);
}

}  // namespace ttsegs
