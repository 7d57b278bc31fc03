// ttsegs/alignment-prior-test.cc

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

#include "ttsegs/alignment-prior.h"
#include "ttsegs/feature-cache.h"

namespace ttsegs {

void UnitTestExactPriorRowsSumToOne() {
  for (int32 i = 0; i < 10; i++) {
    int32 text_len = 1 + kaldi::Rand() % 40, mel_len = 1 + kaldi::Rand() % 200;
    BaseFloat scaling = (i % 2 == 0 ? 1.0 : 0.5 + kaldi::RandUniform());
    Matrix<BaseFloat> prior;
    ComputeBetaBinomialPrior(text_len, mel_len, scaling, &prior);
    KALDI_ASSERT(prior.NumRows() == mel_len && prior.NumCols() == text_len);
    KALDI_ASSERT(prior.Min() >= 0.0);
    for (int32 r = 0; r < mel_len; r++)
      KALDI_ASSERT(kaldi::ApproxEqual(prior.Row(r).Sum(), 1.0, 1.0e-03));
  }
}

void UnitTestExactPriorIsMonotonic() {
  // the most likely text position moves forward with the mel frame
  Matrix<BaseFloat> prior;
  ComputeBetaBinomialPrior(10, 50, 1.0, &prior);
  int32 last = 0;
  for (int32 r = 0; r < prior.NumRows(); r++) {
    int32 best;
    prior.Row(r).Max(&best);
    KALDI_ASSERT(best >= last);
    last = best;
  }
  int32 first_best, last_best;
  prior.Row(0).Max(&first_best);
  prior.Row(prior.NumRows() - 1).Max(&last_best);
  KALDI_ASSERT(first_best == 0 && last_best == 9);
}

void UnitTestSingleTextPosition() {
  Matrix<BaseFloat> prior;
  ComputeBetaBinomialPrior(1, 7, 1.0, &prior);
  for (int32 r = 0; r < 7; r++)
    KALDI_ASSERT(kaldi::ApproxEqual(prior(r, 0), 1.0, 1.0e-04));
}

void UnitTestRoundToBucket() {
  int32 sizes[] = { 1, 2, 3, 7, 20, 100 };
  for (size_t s = 0; s < sizeof(sizes) / sizeof(sizes[0]); s++) {
    int32 to = sizes[s], last = 0;
    KALDI_ASSERT(RoundToBucket(0, to) >= to);
    for (int32 v = 0; v < 1000; v++) {
      int32 b = RoundToBucket(v, to);
      KALDI_ASSERT(b > 0 && b % to == 0);
      KALDI_ASSERT(b >= last);
      last = b;
    }
  }
  KALDI_ASSERT(RoundToBucket(0, 100) == 100);
  KALDI_ASSERT(RoundToBucket(149, 100) == 200);
  KALDI_ASSERT(RoundToBucket(9, 20) == 20);
  KALDI_ASSERT(RoundToBucket(5, 1) == 6);
}

void UnitTestResizeMatrixLinear() {
  Matrix<BaseFloat> in(2, 2);
  in(0, 0) = 0.0; in(0, 1) = 1.0;
  in(1, 0) = 2.0; in(1, 1) = 3.0;
  Matrix<BaseFloat> out;
  ResizeMatrixLinear(in, 3, 3, &out);
  KALDI_ASSERT(out.NumRows() == 3 && out.NumCols() == 3);
  // corners coincide, the centre is the mean
  KALDI_ASSERT(out(0, 0) == 0.0 && out(0, 2) == 1.0);
  KALDI_ASSERT(out(2, 0) == 2.0 && out(2, 2) == 3.0);
  KALDI_ASSERT(kaldi::ApproxEqual(out(1, 1), 1.5));
  KALDI_ASSERT(kaldi::ApproxEqual(out(0, 1), 0.5));

  // same size is the identity
  Matrix<BaseFloat> rand_in(5, 4);
  rand_in.SetRandn();
  ResizeMatrixLinear(rand_in, 5, 4, &out);
  KALDI_ASSERT(out.ApproxEqual(rand_in, 1.0e-05));
}

void UnitTestInterpolatedShape() {
  int32 rounds[] = { 1, 3, 20, 100 };
  for (size_t i = 0; i < sizeof(rounds) / sizeof(rounds[0]); i++) {
    for (size_t j = 0; j < sizeof(rounds) / sizeof(rounds[0]); j++) {
      BetaBinomialInterpolator interpolator(rounds[i], rounds[j]);
      for (int32 k = 0; k < 5; k++) {
        int32 mel_len = 1 + kaldi::Rand() % 300,
            text_len = 1 + kaldi::Rand() % 60;
        Matrix<BaseFloat> prior;
        interpolator.Interpolate(mel_len, text_len, &prior);
        KALDI_ASSERT(prior.NumRows() == mel_len &&
                     prior.NumCols() == text_len);
        KALDI_ASSERT(prior.Min() >= 0.0);
      }
    }
  }
  // with unit buckets a length of v - 1 uses the exact prior of length v
  BetaBinomialInterpolator interpolator(1, 1);
  Matrix<BaseFloat> interpolated, exact;
  interpolator.Interpolate(39, 9, &interpolated);
  ComputeBetaBinomialPrior(10, 40, 1.0, &exact);
  KALDI_ASSERT(interpolator.Bucket(40, 10).ApproxEqual(exact, 0.0));
  Matrix<BaseFloat> resized;
  ResizeMatrixLinear(exact, 39, 9, &resized);
  KALDI_ASSERT(interpolated.ApproxEqual(resized, 1.0e-05));
}

void UnitTestInterpolatorMemoizes() {
  BetaBinomialInterpolator interpolator(100, 20);
  Matrix<BaseFloat> a, b;
  interpolator.Interpolate(250, 37, &a);
  KALDI_ASSERT(interpolator.NumComputed() == 1);
  interpolator.Interpolate(250, 37, &b);
  KALDI_ASSERT(interpolator.NumComputed() == 1);
  KALDI_ASSERT(a.ApproxEqual(b, 0.0));
  // same buckets, different lengths
  interpolator.Interpolate(240, 35, &b);
  KALDI_ASSERT(interpolator.NumComputed() == 1);
  KALDI_ASSERT(interpolator.BankSize() == 1);
  interpolator.Interpolate(20, 3, &b);
  KALDI_ASSERT(interpolator.NumComputed() == 2);
  KALDI_ASSERT(interpolator.BankSize() == 2);
  const Matrix<BaseFloat> &bucket = interpolator.Bucket(300, 40);
  KALDI_ASSERT(bucket.NumRows() == 300 && bucket.NumCols() == 40);
  KALDI_ASSERT(&bucket == &interpolator.Bucket(300, 40));
}

static std::string MakeTempDir() {
  char tmpl[] = "/tmp/alignment-prior-test.XXXXXX";
  char *dir = mkdtemp(tmpl);
  KALDI_ASSERT(dir != NULL);
  return std::string(dir);
}

void UnitTestDiskCachedPrior() {
  std::string dir = MakeTempDir(), dataset = "/data/LJSpeech",
      audio = dataset + "/wavs/LJ001-0001.wav";
  DiskCachedPriorSource source(dir + "/priors", dataset, 1.0);
  std::string cache_path = source.CachePath(audio);
  KALDI_ASSERT(cache_path == dir + "/priors/wavs/LJ001-0001.mat");
  KALDI_ASSERT(!CacheFileExists(cache_path));

  Matrix<BaseFloat> first, second, exact;
  source.GetPrior(audio, 12, 80, &first);
  KALDI_ASSERT(source.NumComputed() == 1 && source.NumCacheHits() == 0);
  KALDI_ASSERT(CacheFileExists(cache_path));
  source.GetPrior(audio, 12, 80, &second);
  KALDI_ASSERT(source.NumComputed() == 1 && source.NumCacheHits() == 1);
  ComputeBetaBinomialPrior(12, 80, 1.0, &exact);
  KALDI_ASSERT(first.ApproxEqual(exact, 0.0));
  KALDI_ASSERT(second.ApproxEqual(exact, 0.0));

  // a stale entry of the wrong shape is recomputed
  source.GetPrior(audio, 13, 80, &second);
  KALDI_ASSERT(second.NumCols() == 13 && source.NumComputed() == 2);

  unlink(cache_path.c_str());
  rmdir((dir + "/priors/wavs").c_str());
  rmdir((dir + "/priors").c_str());
  rmdir(dir.c_str());
}

void UnitTestPriorSourceFactory() {
  AlignmentPriorOptions opts;
  AlignmentPriorSource *source = NewAlignmentPriorSource(opts, "");
  KALDI_ASSERT(source->Type() == "interpolated");
  delete source;

  opts.use_interpolator = false;
  source = NewAlignmentPriorSource(opts, "");
  KALDI_ASSERT(source->Type() == "exact");
  Matrix<BaseFloat> prior;
  source->GetPrior("a.wav", 5, 17, &prior);
  KALDI_ASSERT(prior.NumRows() == 17 && prior.NumCols() == 5);
  delete source;

  opts.online_dir = "/tmp/priors";
  source = NewAlignmentPriorSource(opts, "");
  KALDI_ASSERT(source->Type() == "disk-cached");
  delete source;

  opts.use_interpolator = true;
  bool threw = false;
  try {
    source = NewAlignmentPriorSource(opts, "");
    delete source;
  } catch (const std::exception &) {
    threw = true;
  }
  KALDI_ASSERT(threw);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestExactPriorRowsSumToOne();
  UnitTestExactPriorIsMonotonic();
  UnitTestSingleTextPosition();
  UnitTestRoundToBucket();
  UnitTestResizeMatrixLinear();
  UnitTestInterpolatedShape();
  UnitTestInterpolatorMemoizes();
  UnitTestDiskCachedPrior();
  UnitTestPriorSourceFactory();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
