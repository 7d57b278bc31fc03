// ttsegs/feature-cache-test.cc

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

#include "ttsegs/feature-cache.h"

namespace ttsegs {

static std::string MakeTempDir() {
  char tmpl[] = "/tmp/feature-cache-test.XXXXXX";
  char *dir = mkdtemp(tmpl);
  KALDI_ASSERT(dir != NULL);
  return std::string(dir);
}

static bool Throws(const std::string &dataset, const std::string &audio) {
  try {
    RelativeToDataset(dataset, audio);
  } catch (const std::exception &) {
    return true;
  }
  return false;
}

void UnitTestReplaceExtension() {
  KALDI_ASSERT(ReplaceExtension("a/b/c.wav", ".mat") == "a/b/c.mat");
  KALDI_ASSERT(ReplaceExtension("a/b/c", ".mat") == "a/b/c.mat");
  KALDI_ASSERT(ReplaceExtension("a.d/c", ".mat") == "a.d/c.mat");
  KALDI_ASSERT(ReplaceExtension("a/.hidden", ".mat") == "a/.hidden.mat");
  KALDI_ASSERT(ReplaceExtension("a/c.x.wav", ".pt") == "a/c.x.pt");
}

void UnitTestCachePaths() {
  KALDI_ASSERT(RelativeToDataset("/data/LJ", "/data/LJ/wavs/a.wav") ==
               "wavs/a.wav");
  KALDI_ASSERT(RelativeToDataset("/data/LJ/", "/data/LJ/wavs/a.wav") ==
               "wavs/a.wav");
  KALDI_ASSERT(RelativeToDataset("/data/LJ", "wavs/a.wav") == "wavs/a.wav");
  KALDI_ASSERT(RelativeToDataset("", "/x/a.wav") == "/x/a.wav");
  KALDI_ASSERT(Throws("/data/LJ", "/data/LJSpeech/wavs/a.wav"));
  KALDI_ASSERT(Throws("/data/LJ", "/other/a.wav"));
  KALDI_ASSERT(CachePathForAudio("/cache/", "/data/LJ",
                                 "/data/LJ/wavs/a.wav") ==
               "/cache/wavs/a.mat");
  KALDI_ASSERT(CachePathForAudio("cache", "", "mels/a.pt", ".pitch") ==
               "cache/mels/a.pitch");
}

void UnitTestWriteAndRead() {
  std::string dir = MakeTempDir(), path = dir + "/x/y/z.mat";
  Matrix<BaseFloat> mat(3, 7), mat2;
  mat.SetRandn();
  KALDI_ASSERT(!ReadCachedMatrix(path, &mat2));
  WriteMatrixAtomic(path, mat);
  KALDI_ASSERT(CacheFileExists(path));
  KALDI_ASSERT(!CacheFileExists(dir + "/x/y"));
  KALDI_ASSERT(ReadCachedMatrix(path, &mat2));
  KALDI_ASSERT(mat.ApproxEqual(mat2, 0.0));
  // overwriting is allowed
  mat.Scale(2.0);
  WriteMatrixAtomic(path, mat);
  KALDI_ASSERT(ReadCachedMatrix(path, &mat2));
  KALDI_ASSERT(mat.ApproxEqual(mat2, 0.0));
  unlink(path.c_str());
  rmdir((dir + "/x/y").c_str());
  rmdir((dir + "/x").c_str());
  rmdir(dir.c_str());
}

void UnitTestReadFeatureMatrix() {
  std::string dir = MakeTempDir();
  Vector<BaseFloat> vec(6);
  vec.SetRandn();
  Matrix<BaseFloat> mat(4, 2);
  mat.SetRandn();
  for (int32 binary = 0; binary <= 1; binary++) {
    std::string vec_path = dir + "/vec", mat_path = dir + "/mat";
    kaldi::WriteKaldiObject(vec, vec_path, binary != 0);
    kaldi::WriteKaldiObject(mat, mat_path, binary != 0);
    Matrix<BaseFloat> out;
    bool was_vector;
    ReadFeatureMatrix(vec_path, &out, &was_vector);
    KALDI_ASSERT(was_vector && out.NumRows() == 1 && out.NumCols() == 6);
    Vector<BaseFloat> row(out.Row(0));
    KALDI_ASSERT(row.ApproxEqual(vec, 1.0e-04));
    ReadFeatureMatrix(mat_path, &out, &was_vector);
    KALDI_ASSERT(!was_vector && out.ApproxEqual(mat, 1.0e-04));
    unlink(vec_path.c_str());
    unlink(mat_path.c_str());

    // an empty vector cannot become a 1 by 0 matrix
    kaldi::WriteKaldiObject(Vector<BaseFloat>(), vec_path, binary != 0);
    bool threw = false;
    try {
      ReadFeatureMatrix(vec_path, &out, &was_vector);
    } catch (const std::exception &) {
      threw = true;
    }
    KALDI_ASSERT(threw);
    unlink(vec_path.c_str());
  }
  rmdir(dir.c_str());
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestReplaceExtension();
  UnitTestCachePaths();
  UnitTestWriteAndRead();
  UnitTestReadFeatureMatrix();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
