// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "SetThreadName.h"
#include <concurrentqueue/concurrentqueue.h>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>

namespace Kafcat {

using JobType = std::function<void()>;

/// \brief Class for executing jobs in a separate "worker thread".
///
/// Client engine calls that block the calling thread for up to their timeout
/// (offsets for times, watermark queries) are sent here so that the thread
/// driving consumption only ever waits on a future.
///
/// \note Jobs are executed in the order in which they were enqueued by a
/// single producing thread. No ordering is guaranteed between jobs enqueued
/// from different threads.
class ThreadedExecutor {
public:
  explicit ThreadedExecutor(std::string ThreadName = "executor")
      : Name(std::move(ThreadName)), WorkerThread(ThreadFunction) {}

  ThreadedExecutor(ThreadedExecutor const &) = delete;
  ThreadedExecutor &operator=(ThreadedExecutor const &) = delete;

  /// \brief Destructor, waits for all previously queued jobs to finish.
  ~ThreadedExecutor() {
    sendWork([=]() { RunThread = false; });
    if (WorkerThread.joinable()) {
      WorkerThread.join();
    }
  }

  /// \brief Put a task in the queue.
  ///
  /// \param Task The std::function that will be executed when processing the
  /// task.
  void sendWork(JobType Task) { TaskQueue.enqueue(std::move(Task)); }

  /// \brief Run a function on the worker thread.
  ///
  /// \return Future holding the return value of \p Function, or the
  /// exception it threw.
  template <typename FunctionType>
  auto run(FunctionType Function)
      -> std::future<std::invoke_result_t<FunctionType>> {
    using ResultType = std::invoke_result_t<FunctionType>;
    auto Task =
        std::make_shared<std::packaged_task<ResultType()>>(std::move(Function));
    auto Result = Task->get_future();
    sendWork([Task]() { (*Task)(); });
    return Result;
  }

private:
  std::string const Name;
  bool RunThread{true};
  std::function<void()> ThreadFunction{[=]() {
    setThreadName(Name);
    while (RunThread) {
      JobType CurrentTask;
      if (TaskQueue.try_dequeue(CurrentTask)) {
        CurrentTask();
      } else {
        using namespace std::chrono_literals;
        std::this_thread::sleep_for(5ms);
      }
    }
  }};
  moodycamel::ConcurrentQueue<JobType> TaskQueue;
  std::thread WorkerThread;
};

} // namespace Kafcat
