// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "RdKafkaClientFactory.h"
#include "ConfigureKafka.h"
#include "Errors.h"
#include "RdKafkaAdmin.h"
#include "RdKafkaConsumer.h"
#include "RdKafkaProducer.h"
#include "logger.h"

namespace Kafka {

std::unique_ptr<ConsumerHandle>
RdKafkaClientFactory::createConsumer(BrokerSettings const &Settings) {
  auto EventCallback = std::make_unique<KafkaEventCb>();
  auto Conf = createConfiguration(Settings, EventCallback.get());
  std::string ErrorString;
  auto KafkaConsumer = std::unique_ptr<RdKafka::KafkaConsumer>(
      RdKafka::KafkaConsumer::create(Conf.get(), ErrorString));
  if (KafkaConsumer == nullptr) {
    Logger::Critical("Cannot create kafka consumer: {}", ErrorString);
    throw Kafcat::ConnectionError(
        fmt::format("Cannot create Kafka consumer: {}", ErrorString));
  }
  return std::make_unique<RdKafkaConsumer>(
      std::move(KafkaConsumer), std::move(Conf), std::move(EventCallback));
}

std::unique_ptr<ProducerHandle>
RdKafkaClientFactory::createProducer(BrokerSettings const &Settings) {
  return std::make_unique<RdKafkaProducer>(Settings);
}

std::unique_ptr<AdminHandle>
RdKafkaClientFactory::createAdmin(BrokerSettings const &Settings) {
  return std::make_unique<RdKafkaAdmin>(Settings);
}

} // namespace Kafka
