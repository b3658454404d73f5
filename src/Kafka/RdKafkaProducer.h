// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "BrokerSettings.h"
#include "ClientInterfaces.h"
#include "KafkaEventCb.h"
#include "ProducerDeliveryCb.h"
#include "ProducerStats.h"
#include <librdkafka/rdkafkacpp.h>
#include <memory>

namespace Kafka {

class RdKafkaProducer : public ProducerHandle {
public:
  /// The constructor.
  ///
  /// \param Settings The BrokerSettings.
  /// \throws Kafcat::ConnectionError if librdkafka can not create the
  /// producer.
  explicit RdKafkaProducer(BrokerSettings const &Settings);
  ~RdKafkaProducer() override;

  void produce(ProducerRecord const &Record,
               DeliveryCallback OnDelivery) override;

  /// Polls Kafka for events.
  int poll(duration Timeout) override;

  /// Gets the number of messages not send.
  ///
  /// \return The number of messages.
  int outputQueueLength() override;

  ProducerStats Stats;

private:
  BrokerSettings const ProducerBrokerSettings;
  ProducerDeliveryCb DeliveryCb{Stats};
  KafkaEventCb EventCb;
  std::unique_ptr<RdKafka::Conf> Conf;
  std::unique_ptr<RdKafka::Producer> ProducerPtr;
};

} // namespace Kafka
