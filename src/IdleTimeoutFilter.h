// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once
#include "Clock.h"
#include "TimeUtility.h"
#include <memory>

namespace Kafka {
enum class PollStatus;
}

namespace Kafcat {

/// \brief Decides when a message stream should end based on the poll status.
///
/// The stream ends when no message has arrived for longer than the idle
/// limit, counted from construction or the last message, or right away on a
/// poll error.
class IdleTimeoutFilter {
public:
  enum class StreamState { POLLING, IDLE_TIMEOUT, ERROR };

  explicit IdleTimeoutFilter(
      duration idle_limit,
      std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

  /// \brief Applies the stop logic to the current poll status.
  /// \param current_poll_status The current (last) poll status.
  /// \return Returns true if the stream should end.
  [[nodiscard]] bool shouldStopStream(Kafka::PollStatus current_poll_status);

  [[nodiscard]] StreamState currentState() const { return _state; }

  [[nodiscard]] bool hasTimedOut() const {
    return _state == StreamState::IDLE_TIMEOUT;
  }

  [[nodiscard]] bool hasErrorState() const {
    return _state == StreamState::ERROR;
  }

  [[nodiscard]] time_point getLastActivityTime() const {
    return _last_activity_time;
  }

  [[nodiscard]] duration getIdleLimit() const { return _idle_limit; }

private:
  [[nodiscard]] bool hasExceededIdleLimit() const;

  StreamState _state{StreamState::POLLING};
  duration _idle_limit;
  std::shared_ptr<Clock> _clock;
  time_point _last_activity_time;
};

} // namespace Kafcat
