// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "ClientInterfaces.h"
#include <memory>

namespace Kafka {

/// Create librdkafka backed handles.
class RdKafkaClientFactory : public ClientFactoryInterface {
public:
  std::unique_ptr<ConsumerHandle>
  createConsumer(BrokerSettings const &Settings) override;
  std::unique_ptr<ProducerHandle>
  createProducer(BrokerSettings const &Settings) override;
  std::unique_ptr<AdminHandle>
  createAdmin(BrokerSettings const &Settings) override;
  ~RdKafkaClientFactory() override = default;
};

} // namespace Kafka
