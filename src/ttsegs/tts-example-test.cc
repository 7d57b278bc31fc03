// ttsegs/tts-example-test.cc

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
#include <sstream>

#include "ttsegs/tts-example.h"

namespace ttsegs {

static void RandomExample(int32 text_len, int32 num_frames, bool optional,
                          TtsExample *eg) {
  eg->text.resize(text_len);
  for (int32 i = 0; i < text_len; i++) eg->text[i] = kaldi::Rand() % 100;
  eg->mel.Resize(80, num_frames);
  eg->mel.SetRandn();
  eg->pitch.Resize(1, num_frames);
  eg->pitch.SetRandn();
  eg->energy.Resize(num_frames);
  eg->energy.SetRandn();
  eg->prior.Resize(num_frames, text_len);
  eg->prior.Set(1.0 / text_len);
  eg->speaker = (optional ? 2 : -1);
  eg->audio_path = (optional ? "/data/wavs/LJ001-0001.wav" : "");
  eg->has_prosody = optional;
  eg->prosody.assign(optional ? text_len : 0, 1);
  eg->has_ds_mel = optional;
  if (optional) {
    eg->ds_mel.Resize(10, num_frames / 4 + 1);
    eg->ds_mel.SetRandn();
  }
}

static void AssertEqual(const TtsExample &a, const TtsExample &b) {
  KALDI_ASSERT(a.text == b.text);
  KALDI_ASSERT(a.mel.ApproxEqual(b.mel, 1.0e-04));
  KALDI_ASSERT(a.pitch.ApproxEqual(b.pitch, 1.0e-04));
  KALDI_ASSERT(a.energy.ApproxEqual(b.energy, 1.0e-04));
  KALDI_ASSERT(a.prior.ApproxEqual(b.prior, 1.0e-04));
  KALDI_ASSERT(a.speaker == b.speaker && a.audio_path == b.audio_path);
  KALDI_ASSERT(a.has_prosody == b.has_prosody && a.prosody == b.prosody);
  KALDI_ASSERT(a.has_ds_mel == b.has_ds_mel);
  if (a.has_ds_mel) KALDI_ASSERT(a.ds_mel.ApproxEqual(b.ds_mel, 1.0e-04));
}

void UnitTestCheck() {
  TtsExample eg;
  RandomExample(7, 20, true, &eg);
  eg.Check();
  KALDI_ASSERT(eg.TextLength() == 7 && eg.NumFrames() == 20 &&
               eg.HasSpeaker());
  eg.energy.Resize(19);
  bool threw = false;
  try {
    eg.Check();
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

void UnitTestIo() {
  for (int32 binary = 0; binary <= 1; binary++) {
    for (int32 optional = 0; optional <= 1; optional++) {
      TtsExample eg, eg2;
      RandomExample(5 + kaldi::Rand() % 10, 10 + kaldi::Rand() % 30,
                    optional != 0, &eg);
      // stale fields must not survive Read()
      RandomExample(3, 4, true, &eg2);
      std::ostringstream os;
      eg.Write(os, binary != 0);
      std::istringstream is(os.str());
      eg2.Read(is, binary != 0);
      AssertEqual(eg, eg2);
    }
  }
}

void UnitTestTableIo() {
  char tmpl[] = "/tmp/tts-example-test.XXXXXX";
  char *dir = mkdtemp(tmpl);
  KALDI_ASSERT(dir != NULL);
  std::string ark = std::string(dir) + "/egs.ark";
  std::vector<TtsExample> egs(3);
  {
    TtsExampleWriter writer("ark:" + ark);
    for (size_t i = 0; i < egs.size(); i++) {
      RandomExample(4 + i, 12, i % 2 == 0, &egs[i]);
      std::ostringstream key;
      key << "utt" << i;
      writer.Write(key.str(), egs[i]);
    }
  }
  SequentialTtsExampleReader reader("ark:" + ark);
  size_t n = 0;
  for (; !reader.Done(); reader.Next(), n++) {
    std::ostringstream key;
    key << "utt" << n;
    KALDI_ASSERT(reader.Key() == key.str());
    AssertEqual(egs[n], reader.Value());
  }
  KALDI_ASSERT(n == egs.size());
  reader.Close();
  unlink(ark.c_str());
  rmdir(dir);
}

void UnitTestSwap() {
  TtsExample a, b;
  RandomExample(5, 9, true, &a);
  RandomExample(3, 4, false, &b);
  TtsExample a_copy(a), b_copy(b);
  a.Swap(&b);
  AssertEqual(a, b_copy);
  AssertEqual(b, a_copy);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestCheck();
  UnitTestIo();
  UnitTestTableIo();
  UnitTestSwap();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
