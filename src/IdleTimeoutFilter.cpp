// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "IdleTimeoutFilter.h"

#include "Kafka/PollStatus.h"
#include <utility>

namespace Kafcat {

IdleTimeoutFilter::IdleTimeoutFilter(duration idle_limit,
                                     std::shared_ptr<Clock> clock)
    : _idle_limit(idle_limit), _clock(std::move(clock)),
      _last_activity_time(_clock->get_current_time()) {}

bool IdleTimeoutFilter::hasExceededIdleLimit() const {
  // Deal with potential overflow problems
  if (time_point::max() - _last_activity_time <= _idle_limit) {
    return false;
  }
  return _clock->get_current_time() > _last_activity_time + _idle_limit;
}

bool IdleTimeoutFilter::shouldStopStream(
    Kafka::PollStatus current_poll_status) {
  switch (current_poll_status) {
  case Kafka::PollStatus::Message:
    _state = StreamState::POLLING;
    _last_activity_time = _clock->get_current_time();
    return false;
  case Kafka::PollStatus::EndOfPartition:
  case Kafka::PollStatus::TimedOut:
    if (hasExceededIdleLimit()) {
      _state = StreamState::IDLE_TIMEOUT;
      return true;
    }
    return false;
  case Kafka::PollStatus::Error:
    _state = StreamState::ERROR;
    return true;
  }
  return false;
}

} // namespace Kafcat
