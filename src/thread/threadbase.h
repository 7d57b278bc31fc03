// thread/threadbase.h

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

// Thin wrappers around pthread threads, mutexes and condition variables, used
// by the worker pool in thread/threadpool.h and by the shared caches of the
// example loader.  The design follows "Implementation and Usage of a
// ThreadPool based on POSIX Threads", R. Kriemann, MPI Mathematik, 2003.

#ifndef TTSEGS_THREAD_THREADBASE_H_
#define TTSEGS_THREAD_THREADBASE_H_ 1

#include <pthread.h>

namespace ttsegs {
namespace ThreadPool {

// Basic joinable thread.  Derived classes implement Run().
class Thread {
 public:
  explicit Thread(const int thread_no = -1);

  // The thread must have been joined (or never started) before destruction.
  virtual ~Thread();

  int ThreadNo() const { return thread_no_; }

  bool IsRunning() const { return running_; }

  // Actual work of the thread.
  virtual void Run() = 0;

  // Starts the thread; throws on failure.
  void Create();

  // Waits until the thread has finished.
  void Join();

  // Used by the start routine once Run() returns.
  void ResetRunning() { running_ = false; }

 protected:
  pthread_t thread_id_;
  bool running_;
  bool started_;
  int thread_no_;

 private:
  Thread(const Thread &);
  Thread &operator = (const Thread &);
};

// wrapper for pthread_mutex
class Mutex {
 public:
  Mutex() { pthread_mutex_init(&mutex_, NULL); }
  ~Mutex() { pthread_mutex_destroy(&mutex_); }

  void Lock() { pthread_mutex_lock(&mutex_); }

  void Unlock() { pthread_mutex_unlock(&mutex_); }

 protected:
  pthread_mutex_t mutex_;

 private:
  Mutex(const Mutex &);
  Mutex &operator = (const Mutex &);
};

// Locks a mutex for the lifetime of the object, so that the mutex is released
// when an exception leaves the scope.
class MutexLock {
 public:
  explicit MutexLock(Mutex *mutex): mutex_(mutex) { mutex_->Lock(); }
  ~MutexLock() { mutex_->Unlock(); }
 private:
  Mutex *mutex_;
  MutexLock(const MutexLock &);
  MutexLock &operator = (const MutexLock &);
};

// Condition variable, derived from Mutex so that the predicate can be
// inspected and changed while holding the lock.
class Condition : public Mutex {
 public:
  Condition() { pthread_cond_init(&cond_, NULL); }
  ~Condition() { pthread_cond_destroy(&cond_); }

  // Wait for a signal; the mutex must be locked by the caller.
  void Wait() { pthread_cond_wait(&cond_, &mutex_); }

  void Signal() { pthread_cond_signal(&cond_); }

  void Broadcast() { pthread_cond_broadcast(&cond_); }

 private:
  pthread_cond_t cond_;
};

}  // namespace ThreadPool
}  // namespace ttsegs

#endif  // TTSEGS_THREAD_THREADBASE_H_
