// thread/threadbase.cc

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

#include <cstring>

#include "base/kaldi-common.h"
#include "thread/threadbase.h"

namespace ttsegs {
namespace ThreadPool {

// routine to call Thread::Run()
extern "C" void *RunThread(void *arg) {
  if (arg != NULL) {
    Thread *thread = static_cast<Thread*>(arg);
    thread->Run();
    thread->ResetRunning();
  }
  return NULL;
}

Thread::Thread(const int thread_no): running_(false), started_(false),
                                     thread_no_(thread_no) { }

Thread::~Thread() {
  if (started_)
    KALDI_WARN << "Thread " << thread_no_ << " destroyed without being joined.";
}

void Thread::Create() {
  if (started_) {
    KALDI_WARN << "Thread " << thread_no_ << " is already running.";
    return;
  }
  pthread_attr_t thread_attr;
  int ret;
  if ((ret = pthread_attr_init(&thread_attr)) != 0)
    KALDI_ERR << "pthread_attr_init failed: " << strerror(ret);
  running_ = true;
  ret = pthread_create(&thread_id_, &thread_attr, RunThread, this);
  pthread_attr_destroy(&thread_attr);
  if (ret != 0) {
    running_ = false;
    KALDI_ERR << "Error creating thread " << thread_no_
              << ", errno was: " << strerror(ret);
  }
  started_ = true;
}

void Thread::Join() {
  if (!started_) return;
  int ret;
  if ((ret = pthread_join(thread_id_, NULL)) != 0)
    KALDI_ERR << "Error rejoining thread " << thread_no_ << ": "
              << strerror(ret);
  started_ = false;
  running_ = false;
}

}  // namespace ThreadPool
}  // namespace ttsegs
