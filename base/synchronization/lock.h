// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_SYNCHRONIZATION_LOCK_H_
#define BASE_SYNCHRONIZATION_LOCK_H_

#include <pthread.h>

#include "base/base_export.h"
#include "base/macros.h"

namespace base {

// A convenient wrapper for a non-recursive pthread mutex. In debug builds
// the mutex is created with error checking, so recursive acquisition and
// releasing a lock that is not held are caught.
class BASE_EXPORT Lock {
 public:
  Lock();
  ~Lock();

  void Acquire();
  void Release();

 private:
  pthread_mutex_t native_handle_;

  DISALLOW_COPY_AND_ASSIGN(Lock);
};

// A helper class that acquires the given Lock while the AutoLock is in scope.
class AutoLock {
 public:
  explicit AutoLock(Lock& lock) : lock_(lock) { lock_.Acquire(); }
  ~AutoLock() { lock_.Release(); }

 private:
  Lock& lock_;

  DISALLOW_COPY_AND_ASSIGN(AutoLock);
};

}  // namespace base

#endif  // BASE_SYNCHRONIZATION_LOCK_H_
