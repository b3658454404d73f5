// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "ConnectionLease.h"
#include "IdleTimeoutFilter.h"
#include "Message.h"
#include <optional>

namespace Kafcat {

/// \brief Messages from one consumer connection, ending after an idle
/// period.
///
/// Holds the connection exclusively until it ends, is closed or destroyed.
class MessageStream {
public:
  enum class TerminationReason { Running, IdleTimeout, Error, Closed };

  MessageStream(ConnectionLease Lease, duration PollTimeout,
                duration IdleLimit, std::shared_ptr<Clock> StreamClock);
  MessageStream(MessageStream &&) = default;

  /// \brief Wait for the next message.
  ///
  /// \return The message, or nothing once the stream has ended without
  /// error.
  /// \throws BrokerRoundTripError if polling fails, the stream then ends.
  std::optional<Message> next();

  /// End the stream and release the connection.
  void close();

  [[nodiscard]] TerminationReason terminationReason() const { return Reason; }

private:
  ConnectionLease Lease;
  duration PollTimeout;
  IdleTimeoutFilter Filter;
  TerminationReason Reason{TerminationReason::Running};
};

} // namespace Kafcat
