// ttsegs/parallel-loader.h

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

#ifndef TTSEGS_TTSEGS_PARALLEL_LOADER_H_
#define TTSEGS_TTSEGS_PARALLEL_LOADER_H_

#include <string>
#include <vector>

#include "ttsegs/example-loader.h"
#include "thread/threadpool.h"

namespace ttsegs {

struct ParallelLoaderOptions {
  int32 num_threads;

  ParallelLoaderOptions(): num_threads(1) { }

  void Register(OptionsItf *opts) {
    opts->Register("num-threads", &num_threads,
                   "Number of threads loading examples in parallel.");
  }
};

/// Loads examples on a pool of worker threads.  Each index is loaded by
/// exactly one worker; the ExampleLoader is shared.
class ParallelExampleLoader {
 public:
  /// Does not take ownership of "loader".
  ParallelExampleLoader(const ExampleLoader *loader,
                        const ParallelLoaderOptions &opts);

  /// Loads the examples with the given indices; (*examples)[i] corresponds
  /// to indices[i].  Returns after all loads have finished.  If "errors" is
  /// NULL and any load failed, the error of the first failed index (in the
  /// order of "indices") is thrown; otherwise (*errors)[i] receives the error
  /// message of indices[i], empty on success.
  void LoadExamples(const std::vector<int32> &indices,
                    std::vector<TtsExample> *examples,
                    std::vector<std::string> *errors = NULL);

  int32 NumThreads() const { return pool_.MaxParallel(); }

 private:
  const ExampleLoader *loader_;
  ThreadPool::TPool pool_;

  KALDI_DISALLOW_COPY_AND_ASSIGN(ParallelExampleLoader);
};

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_PARALLEL_LOADER_H_
