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
#include <librdkafka/rdkafkacpp.h>
#include <memory>

namespace Kafka {

/// Topic administration through the librdkafka admin API.
///
/// The admin requests are issued on the C handle underlying a producer
/// instance.
class RdKafkaAdmin : public AdminHandle {
public:
  /// \throws Kafcat::ConnectionError if librdkafka can not create the client.
  explicit RdKafkaAdmin(BrokerSettings const &Settings);

  void createTopic(std::string const &Name, int Partitions,
                   int ReplicationFactor, duration Timeout) override;

private:
  KafkaEventCb EventCb;
  std::unique_ptr<RdKafka::Conf> Conf;
  std::unique_ptr<RdKafka::Producer> Client;
};

} // namespace Kafka
