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
#include "Configs.h"
#include "ConnectionLease.h"
#include "Kafka/BrokerSettings.h"
#include "Kafka/ClientInterfaces.h"
#include "KafkaOffset.h"
#include "MessageStream.h"
#include "ThreadedExecutor.h"
#include <functional>
#include <memory>

namespace Kafcat {

/// \brief Reads messages from a single topic partition.
///
/// All operations share one connection and take turns using it. A stream
/// keeps the connection to itself for its whole lifetime.
class Consumer {
public:
  /// \throws ConfigurationError before any connection is attempted.
  /// \throws ConnectionError if the client can not be created.
  static std::unique_ptr<Consumer>
  fromConfig(ConsumerConfig const &Config,
             Kafka::ClientFactoryInterface &Factory);

  Consumer(ConsumerConfig Config, Kafka::BrokerSettings Settings,
           std::unique_ptr<Kafka::ConsumerHandle> Handle,
           std::shared_ptr<Clock> StreamClock = std::make_shared<SystemClock>());
  Consumer(Consumer const &) = delete;
  Consumer &operator=(Consumer const &) = delete;

  /// \brief Resolve \p Offset and assign the configured partition at it,
  /// replacing any previous assignment.
  void setOffsetAndSubscribe(KafkaOffset const &Offset);

  /// Block until a message arrives.
  /// \throws BrokerRoundTripError on a poll error.
  Message receiveOne();

  /// \return Low and high watermark of the configured partition.
  std::pair<std::int64_t, std::int64_t> getWatermarks();

  /// Blocks while another operation uses the connection.
  MessageStream stream();

  /// \brief Call \p Handler for every message until the stream ends.
  ///
  /// Exceptions from \p Handler or the stream end the iteration and are
  /// passed on.
  void forEach(std::function<void(Message const &)> const &Handler);

  /// Idle period after which a stream ends.
  [[nodiscard]] duration idleLimit() const;

private:
  ConsumerConfig const Config;
  Kafka::BrokerSettings const Settings;
  std::shared_ptr<Connection> Conn;
  std::shared_ptr<Clock> StreamClock;
  ThreadedExecutor Executor{"consumer_exec"};
};

} // namespace Kafcat
