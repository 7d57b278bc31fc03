// ttsegs/parallel-loader.cc

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

#include "ttsegs/parallel-loader.h"

namespace ttsegs {

namespace {

class LoadExampleJob : public ThreadPool::TPool::Job {
 public:
  LoadExampleJob(int n, const ExampleLoader *loader, int32 index,
                 TtsExample *eg)
      : ThreadPool::TPool::Job(n), loader_(loader), index_(index), eg_(eg) { }
  virtual void Run(void *) {
    loader_->Load(index_, eg_);
  }
  int32 Index() const { return index_; }
 private:
  const ExampleLoader *loader_;
  int32 index_;
  TtsExample *eg_;
};

}  // namespace

static unsigned int NumPoolThreads(const ParallelLoaderOptions &opts) {
  if (opts.num_threads < 1)
    KALDI_ERR << "--num-threads must be at least 1, got " << opts.num_threads;
  return opts.num_threads;
}

ParallelExampleLoader::ParallelExampleLoader(
    const ExampleLoader *loader, const ParallelLoaderOptions &opts):
    loader_(loader), pool_(NumPoolThreads(opts)) {
  KALDI_ASSERT(loader_ != NULL);
}

void ParallelExampleLoader::LoadExamples(const std::vector<int32> &indices,
                                         std::vector<TtsExample> *examples,
                                         std::vector<std::string> *errors) {
  examples->clear();
  examples->resize(indices.size());
  std::vector<LoadExampleJob*> jobs(indices.size(), NULL);
  for (size_t i = 0; i < indices.size(); i++) {
    jobs[i] = new LoadExampleJob(i, loader_, indices[i], &((*examples)[i]));
    pool_.Run(jobs[i]);
  }
  if (errors != NULL)
    errors->assign(indices.size(), std::string());
  int32 first_failed = -1;
  std::string error;
  for (size_t i = 0; i < jobs.size(); i++) {
    pool_.Sync(jobs[i]);
    if (jobs[i]->Failed() && errors != NULL) {
      (*errors)[i] = jobs[i]->ErrorMessage();
    } else if (jobs[i]->Failed() && first_failed < 0) {
      first_failed = jobs[i]->Index();
      error = jobs[i]->ErrorMessage();
    }
    delete jobs[i];
  }
  if (first_failed >= 0)
    KALDI_ERR << "Loading example " << first_failed << " failed: " << error;
  KALDI_VLOG(2) << "Loaded " << indices.size() << " examples with "
                << pool_.MaxParallel() << " threads.";
}

}  // namespace ttsegs
