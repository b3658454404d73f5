// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "Configs.h"
#include "Kafka/BrokerSettings.h"
#include "Kafka/ClientInterfaces.h"
#include "Message.h"
#include "TimeUtility.h"
#include <memory>

namespace Kafcat {

/// \brief Publishes messages to the configured topic.
class Producer {
public:
  /// \throws ConfigurationError before any connection is attempted.
  /// \throws ConnectionError if the client can not be created.
  static std::unique_ptr<Producer>
  fromConfig(ProducerConfig const &Config,
             Kafka::ClientFactoryInterface &Factory);

  Producer(ProducerConfig Config, Kafka::BrokerSettings Settings,
           std::unique_ptr<Kafka::ProducerHandle> Handle);
  Producer(Producer const &) = delete;
  Producer &operator=(Producer const &) = delete;
  ~Producer();

  /// \brief Publish \p Msg and wait for the delivery report.
  ///
  /// An empty key or payload is left out of the record. The timestamp is
  /// only set if positive.
  /// \throws BrokerRoundTripError if the message is not delivered.
  void writeOne(Message const &Msg);

  /// Wait for outstanding deliveries.
  /// \return True if nothing is left in the output queue.
  bool flush(duration Timeout);

private:
  ProducerConfig const Config;
  Kafka::BrokerSettings const Settings;
  std::unique_ptr<Kafka::ProducerHandle> Handle;
};

} // namespace Kafcat
