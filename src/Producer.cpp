// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Producer.h"
#include "ClientConfigBuilder.h"
#include "Errors.h"
#include "logger.h"
#include <future>

namespace Kafcat {

std::unique_ptr<Producer>
Producer::fromConfig(ProducerConfig const &Config,
                     Kafka::ClientFactoryInterface &Factory) {
  auto Settings = buildProducerSettings(Config);
  auto Handle = Factory.createProducer(Settings);
  Logger::Info(R"(Producer created for "{}" on {})", Config.Topic,
               Settings.Address);
  return std::make_unique<Producer>(Config, std::move(Settings),
                                    std::move(Handle));
}

Producer::Producer(ProducerConfig Config, Kafka::BrokerSettings Settings,
                   std::unique_ptr<Kafka::ProducerHandle> Handle)
    : Config(std::move(Config)), Settings(std::move(Settings)),
      Handle(std::move(Handle)) {}

Producer::~Producer() {
  if (Handle != nullptr && !flush(Settings.ProducerFlushTimeout)) {
    Logger::Warn("{} message(s) not delivered to \"{}\".",
                 Handle->outputQueueLength(), Config.Topic);
  }
}

void Producer::writeOne(Message const &Msg) {
  Kafka::ProducerRecord Record;
  Record.Topic = Config.Topic;
  if (!Msg.getKey().empty()) {
    Record.Key = Msg.getKey();
  }
  if (!Msg.getPayload().empty()) {
    Record.Payload = Msg.getPayload();
  }
  if (Msg.getTimestamp() > 0) {
    Record.Timestamp = Msg.getTimestamp();
  }
  Record.MessageHeaders = Msg.getHeaders();

  auto Delivery = std::make_shared<std::promise<Kafka::DeliveryResult>>();
  auto Report = Delivery->get_future();
  Handle->produce(Record, [Delivery](Kafka::DeliveryResult const &Result) {
    Delivery->set_value(Result);
  });
  while (Report.wait_for(std::chrono::seconds(0)) !=
         std::future_status::ready) {
    Handle->poll(Settings.PollTimeout);
  }
  auto Result = Report.get();
  if (!Result.Delivered) {
    Logger::Error(R"(Delivery to "{}" failed: {})", Config.Topic,
                  Result.Error);
    throw BrokerRoundTripError(fmt::format(R"(Delivery to "{}" failed: {})",
                                           Config.Topic, Result.Error));
  }
  if (Record.Timestamp > 0) {
    Logger::Trace(R"(Delivered message with timestamp {} to "{}")",
                  fromMilliSeconds(Record.Timestamp), Config.Topic);
  } else {
    Logger::Trace(R"(Delivered message to "{}")", Config.Topic);
  }
}

bool Producer::flush(duration Timeout) {
  auto Deadline = std::chrono::system_clock::now() + Timeout;
  while (Handle->outputQueueLength() > 0) {
    if (std::chrono::system_clock::now() >= Deadline) {
      return false;
    }
    Handle->poll(Settings.PollTimeout);
  }
  return true;
}

} // namespace Kafcat
