// ttsegs/alignment-prior.cc

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
#include <cmath>

#include "ttsegs/alignment-prior.h"
#include "ttsegs/feature-cache.h"

namespace ttsegs {

void AlignmentPriorOptions::Check() const {
  if (round_mel_len_to < 1 || round_text_len_to < 1)
    KALDI_ERR << "Prior bucket sizes must be >= 1, got --prior-round-mel-len-to="
              << round_mel_len_to << " --prior-round-text-len-to="
              << round_text_len_to;
  if (scaling <= 0.0)
    KALDI_ERR << "--prior-scaling must be positive, got " << scaling;
  if (use_interpolator && !online_dir.empty())
    KALDI_ERR << "--use-prior-interpolator=true and --betabinomial-online-dir "
              << "are mutually exclusive.";
}

static inline double LogBeta(double a, double b) {
  return std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
}

void ComputeBetaBinomialPrior(int32 text_len, int32 mel_len,
                              BaseFloat scaling,
                              Matrix<BaseFloat> *prior) {
  KALDI_ASSERT(text_len > 0 && mel_len > 0 && scaling > 0.0);
  prior->Resize(mel_len, text_len, kaldi::kUndefined);
  // The support of the distribution is {0 ... n}, one value per position.
  int32 n = text_len - 1;
  std::vector<double> log_choose(text_len);
  for (int32 k = 0; k <= n; k++)
    log_choose[k] = std::lgamma(n + 1.0) - std::lgamma(k + 1.0) -
        std::lgamma(n - k + 1.0);

  for (int32 i = 0; i < mel_len; i++) {
    double a = scaling * (i + 1),
        b = scaling * (mel_len - i),
        log_norm = LogBeta(a, b);
    SubVector<BaseFloat> row(*prior, i);
    for (int32 k = 0; k <= n; k++)
      row(k) = std::exp(log_choose[k] + LogBeta(k + a, n - k + b) - log_norm);
  }
}

int32 RoundToBucket(int32 value, int32 to) {
  KALDI_ASSERT(to >= 1);
  double q = std::nearbyint((value + 1.0) / to);
  int32 num_buckets = std::max<int32>(1, static_cast<int32>(q));
  return num_buckets * to;
}

// Source coordinate of output index "i" when "in_dim" samples are stretched
// over "out_dim" samples with the end points aligned.
static inline double SourceCoordinate(int32 i, int32 in_dim, int32 out_dim) {
  if (out_dim <= 1 || in_dim <= 1) return 0.0;
  return i * static_cast<double>(in_dim - 1) / (out_dim - 1);
}

void ResizeMatrixLinear(const MatrixBase<BaseFloat> &in,
                        int32 num_rows, int32 num_cols,
                        Matrix<BaseFloat> *out) {
  int32 in_rows = in.NumRows(), in_cols = in.NumCols();
  KALDI_ASSERT(in_rows > 0 && in_cols > 0 && num_rows > 0 && num_cols > 0);
  out->Resize(num_rows, num_cols, kaldi::kUndefined);

  std::vector<int32> col0(num_cols), col1(num_cols);
  std::vector<BaseFloat> col_frac(num_cols);
  for (int32 c = 0; c < num_cols; c++) {
    double x = SourceCoordinate(c, in_cols, num_cols);
    col0[c] = std::min(static_cast<int32>(x), in_cols - 1);
    col1[c] = std::min(col0[c] + 1, in_cols - 1);
    col_frac[c] = x - col0[c];
  }
  for (int32 r = 0; r < num_rows; r++) {
    double y = SourceCoordinate(r, in_rows, num_rows);
    int32 r0 = std::min(static_cast<int32>(y), in_rows - 1),
        r1 = std::min(r0 + 1, in_rows - 1);
    BaseFloat row_frac = y - r0;
    for (int32 c = 0; c < num_cols; c++) {
      BaseFloat top = in(r0, col0[c]) +
          col_frac[c] * (in(r0, col1[c]) - in(r0, col0[c])),
          bottom = in(r1, col0[c]) +
          col_frac[c] * (in(r1, col1[c]) - in(r1, col0[c]));
      (*out)(r, c) = top + row_frac * (bottom - top);
    }
  }
}


BetaBinomialInterpolator::BetaBinomialInterpolator(int32 round_mel_len_to,
                                                   int32 round_text_len_to,
                                                   BaseFloat scaling):
    round_mel_len_to_(round_mel_len_to),
    round_text_len_to_(round_text_len_to),
    scaling_(scaling), num_computed_(0) {
  KALDI_ASSERT(round_mel_len_to_ >= 1 && round_text_len_to_ >= 1);
}

const Matrix<BaseFloat> &BetaBinomialInterpolator::Bucket(
    int32 bucket_mel, int32 bucket_text) const {
  std::pair<int32, int32> key(bucket_mel, bucket_text);
  // The lock is held during the computation so that a bucket requested by
  // several threads at once is computed only once.
  ThreadPool::MutexLock lock(&mutex_);
  BankType::iterator iter = bank_.find(key);
  if (iter != bank_.end())
    return iter->second;
  Matrix<BaseFloat> exact;
  ComputeBetaBinomialPrior(bucket_text, bucket_mel, scaling_, &exact);
  num_computed_++;
  Matrix<BaseFloat> &entry = bank_[key];
  entry.Swap(&exact);
  KALDI_VLOG(2) << "Computed prior bucket (" << bucket_mel << ", "
                << bucket_text << "), bank size is " << bank_.size();
  return entry;
}

void BetaBinomialInterpolator::Interpolate(int32 mel_len, int32 text_len,
                                           Matrix<BaseFloat> *prior) const {
  KALDI_ASSERT(mel_len > 0 && text_len > 0);
  int32 bucket_mel = RoundToBucket(mel_len, round_mel_len_to_),
      bucket_text = RoundToBucket(text_len, round_text_len_to_);
  const Matrix<BaseFloat> &bucket = Bucket(bucket_mel, bucket_text);
  ResizeMatrixLinear(bucket, mel_len, text_len, prior);
  if (prior->NumRows() != mel_len || prior->NumCols() != text_len)
    KALDI_ERR << "Interpolated prior has shape (" << prior->NumRows() << ", "
              << prior->NumCols() << "), expected (" << mel_len << ", "
              << text_len << ") [bucket (" << bucket_mel << ", " << bucket_text
              << ")]";
}

int32 BetaBinomialInterpolator::NumComputed() const {
  ThreadPool::MutexLock lock(&mutex_);
  return num_computed_;
}

int32 BetaBinomialInterpolator::BankSize() const {
  ThreadPool::MutexLock lock(&mutex_);
  return bank_.size();
}


void ExactPriorSource::GetPrior(const std::string &audio_path,
                                int32 text_len, int32 mel_len,
                                Matrix<BaseFloat> *prior) const {
  ComputeBetaBinomialPrior(text_len, mel_len, scaling_, prior);
}

void InterpolatedPriorSource::GetPrior(const std::string &audio_path,
                                       int32 text_len, int32 mel_len,
                                       Matrix<BaseFloat> *prior) const {
  interpolator_.Interpolate(mel_len, text_len, prior);
}


DiskCachedPriorSource::DiskCachedPriorSource(const std::string &cache_dir,
                                             const std::string &dataset_path,
                                             BaseFloat scaling):
    cache_dir_(cache_dir), dataset_path_(dataset_path), scaling_(scaling),
    num_computed_(0), num_cache_hits_(0) {
  KALDI_ASSERT(!cache_dir_.empty());
}

std::string DiskCachedPriorSource::CachePath(
    const std::string &audio_path) const {
  return CachePathForAudio(cache_dir_, dataset_path_, audio_path);
}

void DiskCachedPriorSource::GetPrior(const std::string &audio_path,
                                     int32 text_len, int32 mel_len,
                                     Matrix<BaseFloat> *prior) const {
  std::string path = CachePath(audio_path);
  if (ReadCachedMatrix(path, prior)) {
    if (prior->NumRows() == mel_len && prior->NumCols() == text_len) {
      ThreadPool::MutexLock lock(&mutex_);
      num_cache_hits_++;
      return;
    }
    KALDI_WARN << "Cached prior " << path << " has shape ("
               << prior->NumRows() << ", " << prior->NumCols()
               << "), expected (" << mel_len << ", " << text_len
               << "); recomputing it.";
  }
  ComputeBetaBinomialPrior(text_len, mel_len, scaling_, prior);
  {
    ThreadPool::MutexLock lock(&mutex_);
    num_computed_++;
  }
  try {
    WriteMatrixAtomic(path, *prior);
  } catch (const std::exception &e) {
    KALDI_WARN << "Could not write prior cache file " << path << ": "
               << e.what();
  }
}

int32 DiskCachedPriorSource::NumComputed() const {
  ThreadPool::MutexLock lock(&mutex_);
  return num_computed_;
}

int32 DiskCachedPriorSource::NumCacheHits() const {
  ThreadPool::MutexLock lock(&mutex_);
  return num_cache_hits_;
}


AlignmentPriorSource *NewAlignmentPriorSource(const AlignmentPriorOptions &opts,
                                              const std::string &dataset_path) {
  opts.Check();
  if (opts.use_interpolator)
    return new InterpolatedPriorSource(opts.round_mel_len_to,
                                       opts.round_text_len_to, opts.scaling);
  if (!opts.online_dir.empty())
    return new DiskCachedPriorSource(opts.online_dir, dataset_path,
                                     opts.scaling);
  return new ExactPriorSource(opts.scaling);
}

}  // namespace ttsegs
