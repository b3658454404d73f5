// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <chrono>
#include <mutex>

namespace Kafcat {

class Clock {
public:
  using time_point = std::chrono::system_clock::time_point;
  using duration = std::chrono::system_clock::duration;

  virtual ~Clock() = default;

  [[nodiscard]] virtual time_point get_current_time() const = 0;
};

class SystemClock : public Clock {
public:
  [[nodiscard]] time_point get_current_time() const override {
    return std::chrono::system_clock::now();
  }
};

/// Manually driven clock. Shared between a test and the code under test, so
/// access is synchronised.
class FakeClock : public Clock {
public:
  void set_time(time_point time) {
    std::lock_guard<std::mutex> Lock(Mutex);
    fake_time_point_ = time;
  }

  void advance(duration step) {
    std::lock_guard<std::mutex> Lock(Mutex);
    fake_time_point_ += step;
  }

  [[nodiscard]] time_point get_current_time() const override {
    std::lock_guard<std::mutex> Lock(Mutex);
    return fake_time_point_;
  }

private:
  mutable std::mutex Mutex;
  time_point fake_time_point_;
};

} // namespace Kafcat
