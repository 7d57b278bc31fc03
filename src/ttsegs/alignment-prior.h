// ttsegs/alignment-prior.h

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

#ifndef TTSEGS_TTSEGS_ALIGNMENT_PRIOR_H_
#define TTSEGS_TTSEGS_ALIGNMENT_PRIOR_H_

#include <map>
#include <string>
#include <utility>

#include "ttsegs/ttsegs-common.h"
#include "thread/threadbase.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

/**
   The alignment prior biases the attention between text positions and mel
   frames towards a monotonic alignment.  Throughout this library the prior
   of an utterance with P text positions and M mel frames is a matrix with M
   rows (mel frames) and P columns (text positions); element (i, j) is the
   prior probability that frame i is aligned to position j.

   Row i (0-based) is the beta-binomial distribution over the P positions
   with parameters alpha = scaling * (i + 1), beta = scaling * (M - i), so
   the mass moves from the start to the end of the text as i increases and
   is sharpest near the ends.
*/

struct AlignmentPriorOptions {
  bool use_interpolator;
  int32 round_mel_len_to;
  int32 round_text_len_to;
  BaseFloat scaling;
  std::string online_dir;

  AlignmentPriorOptions(): use_interpolator(true),
                           round_mel_len_to(100),
                           round_text_len_to(20),
                           scaling(1.0) { }

  void Register(OptionsItf *opts) {
    opts->Register("use-prior-interpolator", &use_interpolator,
                   "If true, compute alignment priors for rounded (bucket) "
                   "lengths once and resize them to the requested lengths by "
                   "bilinear interpolation.");
    opts->Register("prior-round-mel-len-to", &round_mel_len_to,
                   "Bucket size for mel lengths of the prior interpolator.");
    opts->Register("prior-round-text-len-to", &round_text_len_to,
                   "Bucket size for text lengths of the prior interpolator.");
    opts->Register("prior-scaling", &scaling,
                   "Scaling of the beta-binomial shape parameters; larger "
                   "values give sharper priors.");
    opts->Register("betabinomial-online-dir", &online_dir,
                   "If set (and --use-prior-interpolator=false), exact priors "
                   "are cached in this directory.");
  }

  /// Checks values and mutually exclusive settings; throws on error.
  void Check() const;
};

/// Computes the exact beta-binomial prior for "text_len" positions and
/// "mel_len" frames; "prior" is resized to mel_len by text_len.  Each row
/// sums to one.
void ComputeBetaBinomialPrior(int32 text_len, int32 mel_len,
                              BaseFloat scaling,
                              Matrix<BaseFloat> *prior);

/// Rounds "value" to a multiple of "to" (to >= 1):
///   max(1, round((value + 1) / to)) * to,
/// rounding halves to even.  Non-decreasing in "value" and never less than
/// "to".
int32 RoundToBucket(int32 value, int32 to);

/// Resizes "in" to num_rows by num_cols with order-1 (bilinear) interpolation.
/// The corner elements of input and output coincide; a dimension of size one
/// samples the first input row or column.
void ResizeMatrixLinear(const MatrixBase<BaseFloat> &in,
                        int32 num_rows, int32 num_cols,
                        Matrix<BaseFloat> *out);


/// Memoizing bank of exact priors for bucketed lengths, plus resizing.
/// Buckets are never evicted: memory grows with the number of distinct
/// (mel bucket, text bucket) pairs in the corpus, which is small because the
/// bucket sizes coarsen the lengths.  Safe to use from several threads; each
/// bucket is computed at most once.
class BetaBinomialInterpolator {
 public:
  BetaBinomialInterpolator(int32 round_mel_len_to, int32 round_text_len_to,
                           BaseFloat scaling = 1.0);

  /// Outputs the interpolated prior of shape mel_len by text_len.
  void Interpolate(int32 mel_len, int32 text_len,
                   Matrix<BaseFloat> *prior) const;

  /// Returns the exact prior of the bucket pair, computing it on first use.
  /// The reference stays valid for the lifetime of the object.
  const Matrix<BaseFloat> &Bucket(int32 bucket_mel, int32 bucket_text) const;

  /// Number of exact bucket computations performed so far.
  int32 NumComputed() const;

  /// Number of buckets held.
  int32 BankSize() const;

 private:
  typedef std::map<std::pair<int32, int32>, Matrix<BaseFloat> > BankType;

  int32 round_mel_len_to_;
  int32 round_text_len_to_;
  BaseFloat scaling_;

  mutable ThreadPool::Mutex mutex_;
  mutable BankType bank_;
  mutable int32 num_computed_;

  KALDI_DISALLOW_COPY_AND_ASSIGN(BetaBinomialInterpolator);
};


/// Source of alignment priors.  The retrieval strategy is chosen once, when
/// the source is created (see NewAlignmentPriorSource()).
class AlignmentPriorSource {
 public:
  /// Outputs the prior (mel_len by text_len) for the utterance whose audio is
  /// at "audio_path".
  virtual void GetPrior(const std::string &audio_path,
                        int32 text_len, int32 mel_len,
                        Matrix<BaseFloat> *prior) const = 0;

  /// Name for logging.
  virtual std::string Type() const = 0;

  virtual ~AlignmentPriorSource() { }
};

/// Recomputes the exact prior on every request.
class ExactPriorSource: public AlignmentPriorSource {
 public:
  explicit ExactPriorSource(BaseFloat scaling): scaling_(scaling) { }
  virtual void GetPrior(const std::string &audio_path,
                        int32 text_len, int32 mel_len,
                        Matrix<BaseFloat> *prior) const;
  virtual std::string Type() const { return "exact"; }
 private:
  BaseFloat scaling_;
};

/// Interpolates from bucketed priors held in memory.
class InterpolatedPriorSource: public AlignmentPriorSource {
 public:
  InterpolatedPriorSource(int32 round_mel_len_to, int32 round_text_len_to,
                          BaseFloat scaling):
      interpolator_(round_mel_len_to, round_text_len_to, scaling) { }
  virtual void GetPrior(const std::string &audio_path,
                        int32 text_len, int32 mel_len,
                        Matrix<BaseFloat> *prior) const;
  virtual std::string Type() const { return "interpolated"; }
  const BetaBinomialInterpolator &Interpolator() const { return interpolator_; }
 private:
  BetaBinomialInterpolator interpolator_;
};

/// Exact priors cached on disk, one file per utterance, at
/// CachePathForAudio(cache_dir, dataset_path, audio_path).
class DiskCachedPriorSource: public AlignmentPriorSource {
 public:
  DiskCachedPriorSource(const std::string &cache_dir,
                        const std::string &dataset_path,
                        BaseFloat scaling);
  virtual void GetPrior(const std::string &audio_path,
                        int32 text_len, int32 mel_len,
                        Matrix<BaseFloat> *prior) const;
  virtual std::string Type() const { return "disk-cached"; }

  std::string CachePath(const std::string &audio_path) const;

  /// Counters, for diagnostics.
  int32 NumComputed() const;
  int32 NumCacheHits() const;
 private:
  std::string cache_dir_;
  std::string dataset_path_;
  BaseFloat scaling_;
  mutable ThreadPool::Mutex mutex_;
  mutable int32 num_computed_;
  mutable int32 num_cache_hits_;
};

/// Creates the source selected by "opts"; the caller owns the result.
AlignmentPriorSource *NewAlignmentPriorSource(const AlignmentPriorOptions &opts,
                                              const std::string &dataset_path);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_ALIGNMENT_PRIOR_H_
