// thread/threadpool.cc

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

#include <exception>

#include "base/kaldi-common.h"
#include "thread/threadpool.h"

namespace ttsegs {
namespace ThreadPool {

TPool::Job::Job(const int n): job_no_(n), done_(true), failed_(false) { }

TPool::Job::~Job() {
  done_cond_.Lock();
  bool done = done_;
  done_cond_.Unlock();
  if (!done)
    KALDI_WARN << "Job " << job_no_ << " destroyed while still running.";
}

void TPool::Job::Reset() {
  done_cond_.Lock();
  done_ = false;
  failed_ = false;
  error_.clear();
  done_cond_.Unlock();
}

void TPool::Job::Finish(bool failed, const std::string &error) {
  done_cond_.Lock();
  done_ = true;
  failed_ = failed;
  error_ = error;
  done_cond_.Broadcast();
  done_cond_.Unlock();
}

void TPool::Job::Wait() {
  done_cond_.Lock();
  while (!done_)
    done_cond_.Wait();
  done_cond_.Unlock();
}


TPool::TPool(const unsigned int max_p): max_parallel_(max_p) {
  KALDI_ASSERT(max_parallel_ > 0);
  threads_.resize(max_parallel_, NULL);
  for (unsigned int i = 0; i < max_parallel_; i++) {
    threads_[i] = new TPoolThr(i, this);
    threads_[i]->Create();
  }
  KALDI_VLOG(2) << "Created thread pool with " << max_parallel_ << " threads.";
}

TPool::~TPool() {
  SyncAll();
  for (unsigned int i = 0; i < max_parallel_; i++)
    threads_[i]->Quit();
  for (unsigned int i = 0; i < max_parallel_; i++) {
    threads_[i]->Join();
    delete threads_[i];
  }
  KALDI_VLOG(2) << "Thread pool stopped.";
}

void TPool::Run(TPool::Job *job, void *ptr, const bool del) {
  if (job == NULL)
    return;
  job->Reset();
  TPoolThr *thr = GetIdle();
  thr->SetJob(job, ptr, del);
  KALDI_VLOG(3) << "Job " << job->JobNo() << " assigned to thread "
                << thr->ThreadNo();
}

void TPool::Sync(Job *job) {
  if (job == NULL)
    return;
  job->Wait();
}

void TPool::SyncAll() {
  idle_cond_.Lock();
  while (idle_threads_.size() < max_parallel_)
    idle_cond_.Wait();
  idle_cond_.Unlock();
}

TPoolThr *TPool::GetIdle() {
  idle_cond_.Lock();
  while (idle_threads_.empty())
    idle_cond_.Wait();
  TPoolThr *t = idle_threads_.front();
  idle_threads_.pop_front();
  idle_cond_.Unlock();
  return t;
}

void TPool::AppendIdle(TPoolThr *t) {
  idle_cond_.Lock();
  bool present = false;
  for (std::list<TPoolThr*>::iterator iter = idle_threads_.begin();
       iter != idle_threads_.end(); ++iter) {
    if (*iter == t) { present = true; break; }
  }
  if (!present)
    idle_threads_.push_back(t);
  // wakes both GetIdle() and SyncAll()
  idle_cond_.Broadcast();
  idle_cond_.Unlock();
}


void TPoolThr::Run() {
  while (true) {
    pool_->AppendIdle(this);
    work_cond_.Lock();
    while (job_ == NULL && !end_)
      work_cond_.Wait();
    if (job_ == NULL) {  // end_ was set
      work_cond_.Unlock();
      break;
    }
    TPool::Job *job = job_;
    void *data = data_ptr_;
    bool del = del_job_;
    work_cond_.Unlock();

    bool failed = false;
    std::string error;
    try {
      job->Run(data);
    } catch (const std::exception &e) {
      failed = true;
      error = e.what();
    }
    if (failed && del)
      KALDI_WARN << "Job " << job->JobNo() << " failed: " << error;

    work_cond_.Lock();
    job_ = NULL;
    data_ptr_ = NULL;
    work_cond_.Unlock();

    job->Finish(failed, error);
    if (del)
      delete job;
  }
  KALDI_VLOG(3) << "Thread " << thread_no_ << " quit.";
}

void TPoolThr::SetJob(TPool::Job *j, void *p, const bool del) {
  work_cond_.Lock();
  job_ = j;
  data_ptr_ = p;
  del_job_ = del;
  work_cond_.Signal();
  work_cond_.Unlock();
}

void TPoolThr::Quit() {
  work_cond_.Lock();
  end_ = true;
  work_cond_.Signal();
  work_cond_.Unlock();
}

}  // namespace ThreadPool
}  // namespace ttsegs
