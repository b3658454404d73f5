// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "ThreadedExecutor.h"
#include <gtest/gtest.h>
#include <stdexcept>

using Kafcat::ThreadedExecutor;

class ThreadedExecutorTest : public ::testing::Test {};

TEST_F(ThreadedExecutorTest, RunJob) {
  bool SomeVariable{false};
  {
    ThreadedExecutor Executor;
    Executor.sendWork([&SomeVariable]() { SomeVariable = true; });
  }
  EXPECT_TRUE(SomeVariable);
}

TEST_F(ThreadedExecutorTest, Exit) {
  { ThreadedExecutor Executor("idle"); }
  SUCCEED();
}

TEST_F(ThreadedExecutorTest, RunReturnsResult) {
  ThreadedExecutor Executor;
  auto Result = Executor.run([]() { return 42; });
  EXPECT_EQ(Result.get(), 42);
}

TEST_F(ThreadedExecutorTest, RunPassesOnException) {
  ThreadedExecutor Executor;
  auto Result = Executor.run([]() -> int { throw std::runtime_error("fail"); });
  EXPECT_THROW(Result.get(), std::runtime_error);
}

TEST_F(ThreadedExecutorTest, JobsRunInOrder) {
  std::vector<int> Order;
  {
    ThreadedExecutor Executor;
    for (int i = 0; i < 10; ++i) {
      Executor.sendWork([&Order, i]() { Order.push_back(i); });
    }
  }
  std::vector<int> Expected{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
  EXPECT_EQ(Order, Expected);
}
