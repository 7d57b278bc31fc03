// thread/threadpool.h

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

#ifndef TTSEGS_THREAD_THREADPOOL_H_
#define TTSEGS_THREAD_THREADPOOL_H_ 1

#include <list>
#include <string>
#include <vector>

#include "thread/threadbase.h"

namespace ttsegs {
namespace ThreadPool {

class TPoolThr;

// A fixed set of worker threads.  Jobs handed to Run() are executed by the
// first idle thread; Run() blocks while all threads are busy.
class TPool {
  friend class TPoolThr;
 public:
  class Job;

  // Creates max_p worker threads (max_p >= 1).
  explicit TPool(const unsigned int max_p);

  // Waits for all jobs to finish, then stops and joins the threads.
  ~TPool();

  unsigned int MaxParallel() const { return max_parallel_; }

  // Hands "job" to an idle thread.  "ptr" is passed to job->Run().  If "del"
  // is true the pool deletes the job once it has finished, so the caller must
  // not Sync() on it.
  void Run(Job *job, void *ptr = NULL, const bool del = false);

  // Waits until "job" has finished.
  void Sync(Job *job);

  // Waits until every thread is idle.
  void SyncAll();

 protected:
  TPoolThr *GetIdle();
  void AppendIdle(TPoolThr *t);

  unsigned int max_parallel_;
  std::vector<TPoolThr*> threads_;
  // threads waiting for work; guarded by idle_cond_
  std::list<TPoolThr*> idle_threads_;
  Condition idle_cond_;

 private:
  TPool(const TPool &);
  TPool &operator = (const TPool &);
};

// Unit of work.  Exceptions derived from std::exception thrown by Run() are
// caught by the worker and recorded; check Failed() after Sync().
class TPool::Job {
 public:
  explicit Job(const int n = -1);
  virtual ~Job();

  // The actual work.
  virtual void Run(void *ptr) = 0;

  int JobNo() const { return job_no_; }

  bool Failed() const { return failed_; }

  const std::string &ErrorMessage() const { return error_; }

 private:
  friend class TPool;
  friend class TPoolThr;

  void Reset();
  void Finish(bool failed, const std::string &error);
  void Wait();

  const int job_no_;
  Condition done_cond_;
  bool done_;
  bool failed_;
  std::string error_;

  Job(const Job &);
  Job &operator = (const Job &);
};

// thread owned by a TPool
class TPoolThr : public Thread {
 public:
  TPoolThr(const int n, TPool *p)
      : Thread(n), pool_(p), job_(NULL), data_ptr_(NULL), del_job_(false),
        end_(false) { }

  void Run();

  void SetJob(TPool::Job *j, void *p, const bool del);

  // Asks the thread to leave its loop once it is idle.
  void Quit();

 protected:
  TPool *pool_;
  TPool::Job *job_;
  void *data_ptr_;
  bool del_job_;
  // guards job_, data_ptr_, del_job_ and end_
  Condition work_cond_;
  bool end_;
};

}  // namespace ThreadPool
}  // namespace ttsegs

#endif  // TTSEGS_THREAD_THREADPOOL_H_
