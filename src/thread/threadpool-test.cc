// thread/threadpool-test.cc

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

#include <stdexcept>
#include <vector>

#include "base/kaldi-common.h"
#include "thread/threadpool.h"

namespace ttsegs {

// Sums the integers in [start, end) into *sum.
class SumJob : public ThreadPool::TPool::Job {
 public:
  SumJob(int n, int start, int end, long *sum)
      : ThreadPool::TPool::Job(n), start_(start), end_(end), sum_(sum) { }
  virtual void Run(void *) {
    long s = 0;
    for (int i = start_; i < end_; i++) s += i;
    *sum_ = s;
  }
 private:
  int start_, end_;
  long *sum_;
};

class FailingJob : public ThreadPool::TPool::Job {
 public:
  explicit FailingJob(int n): ThreadPool::TPool::Job(n) { }
  virtual void Run(void *) {
    throw std::runtime_error("job failed on purpose");
  }
};

void UnitTestThreadPoolSum() {
  int num_jobs = 10, block = 1000;
  std::vector<long> sums(num_jobs, 0);
  std::vector<SumJob*> jobs;
  {
    ThreadPool::TPool pool(3);
    KALDI_ASSERT(pool.MaxParallel() == 3);
    for (int i = 0; i < num_jobs; i++)
      jobs.push_back(new SumJob(i, i * block, (i + 1) * block, &sums[i]));
    for (int i = 0; i < num_jobs; i++) pool.Run(jobs[i]);
    for (int i = 0; i < num_jobs; i++) pool.Sync(jobs[i]);
    for (int i = 0; i < num_jobs; i++) KALDI_ASSERT(!jobs[i]->Failed());
  }
  long total = 0;
  for (int i = 0; i < num_jobs; i++) total += sums[i];
  long n = static_cast<long>(num_jobs) * block;
  KALDI_ASSERT(total == n * (n - 1) / 2);
  for (int i = 0; i < num_jobs; i++) delete jobs[i];
}

void UnitTestThreadPoolFailure() {
  ThreadPool::TPool pool(2);
  FailingJob job(7);
  pool.Run(&job);
  pool.Sync(&job);
  KALDI_ASSERT(job.Failed());
  KALDI_ASSERT(job.ErrorMessage() == "job failed on purpose");
  // a failed job can be resubmitted
  pool.Run(&job);
  pool.Sync(&job);
  KALDI_ASSERT(job.Failed());
  pool.SyncAll();
}

void UnitTestThreadPoolDeleteJobs() {
  std::vector<long> sums(4, 0);
  ThreadPool::TPool pool(2);
  for (int i = 0; i < 4; i++)
    pool.Run(new SumJob(i, 0, 10, &sums[i]), NULL, true);
  pool.SyncAll();
  for (int i = 0; i < 4; i++) KALDI_ASSERT(sums[i] == 45);
}

}  // namespace ttsegs

int main() {
  using namespace ttsegs;
  UnitTestThreadPoolSum();
  UnitTestThreadPoolFailure();
  UnitTestThreadPoolDeleteJobs();
  KALDI_LOG << "Tests succeeded.";
  return 0;
}
