// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "MessageStream.h"
#include "Errors.h"
#include "Kafka/PollStatus.h"
#include "logger.h"

namespace Kafcat {

MessageStream::MessageStream(ConnectionLease Lease, duration PollTimeout,
                             duration IdleLimit,
                             std::shared_ptr<Clock> StreamClock)
    : Lease(std::move(Lease)), PollTimeout(PollTimeout),
      Filter(IdleLimit, std::move(StreamClock)) {}

std::optional<Message> MessageStream::next() {
  while (Reason == TerminationReason::Running) {
    auto Result = Lease.handle().poll(PollTimeout);
    if (Filter.shouldStopStream(Result.Status)) {
      Lease.release();
      if (Filter.hasErrorState()) {
        Reason = TerminationReason::Error;
        Logger::Error("Error while polling for messages: {}",
                      Result.ErrorString);
        throw BrokerRoundTripError(fmt::format(
            "Error while polling for messages: {}", Result.ErrorString));
      }
      Reason = TerminationReason::IdleTimeout;
      Logger::Debug("No message since {} (limit {} ms), ending stream.",
                    Filter.getLastActivityTime(),
                    toMilliSeconds(Filter.getIdleLimit()));
      break;
    }
    if (Result.Status == Kafka::PollStatus::Message) {
      Logger::Trace("Received message with timestamp {}.",
                    fromMilliSeconds(Result.Msg.getTimestamp()));
      return std::move(Result.Msg);
    }
  }
  return {};
}

void MessageStream::close() {
  if (Reason == TerminationReason::Running) {
    Reason = TerminationReason::Closed;
  }
  Lease.release();
}

} // namespace Kafcat
