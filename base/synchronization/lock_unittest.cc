// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/synchronization/lock.h"

#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace base {

TEST(LockTest, AutoLockSerializesIncrements) {
  Lock lock;
  int counter = 0;
  const int kThreads = 4;
  const int kIterations = 1000;

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&lock, &counter] {
      for (int j = 0; j < kIterations; ++j) {
        AutoLock auto_lock(lock);
        ++counter;
      }
    });
  }
  for (std::thread& thread : threads)
    thread.join();

  EXPECT_EQ(kThreads * kIterations, counter);
}

}  // namespace base
