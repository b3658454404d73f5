// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Consumer.h"
#include "ClientConfigBuilder.h"
#include "Errors.h"
#include "OffsetResolver.h"
#include "logger.h"

namespace Kafcat {

std::unique_ptr<Consumer>
Consumer::fromConfig(ConsumerConfig const &Config,
                     Kafka::ClientFactoryInterface &Factory) {
  auto Settings = buildConsumerSettings(Config);
  auto Handle = Factory.createConsumer(Settings);
  Logger::Info(R"(Consumer created for "{}" partition {} on {})", Config.Topic,
               Config.partition(), Settings.Address);
  return std::make_unique<Consumer>(Config, std::move(Settings),
                                    std::move(Handle));
}

Consumer::Consumer(ConsumerConfig Config, Kafka::BrokerSettings Settings,
                   std::unique_ptr<Kafka::ConsumerHandle> Handle,
                   std::shared_ptr<Clock> StreamClock)
    : Config(std::move(Config)), Settings(std::move(Settings)),
      Conn(std::make_shared<Connection>(std::move(Handle))),
      StreamClock(std::move(StreamClock)) {}

duration Consumer::idleLimit() const {
  if (Config.ExitOnDone) {
    return 3s;
  }
  return std::chrono::hours(1);
}

void Consumer::setOffsetAndSubscribe(KafkaOffset const &Offset) {
  ConnectionLease Lease(Conn);
  auto Concrete =
      resolveOffset(Offset, Config.Topic, Config.partition(), Lease.handle(),
                    Executor, Settings.OffsetsForTimesTimeout);
  Logger::Info(R"(Assigning "{}" partition {} at offset {} ({}))",
               Config.Topic, Config.partition(), Concrete, toString(Offset));
  Lease.handle().assign(Config.Topic, Config.partition(), Concrete);
}

Message Consumer::receiveOne() {
  ConnectionLease Lease(Conn);
  while (true) {
    auto Result = Lease.handle().poll(Settings.PollTimeout);
    switch (Result.Status) {
    case Kafka::PollStatus::Message:
      return std::move(Result.Msg);
    case Kafka::PollStatus::Error:
      Logger::Error("Error while polling for a message: {}",
                    Result.ErrorString);
      throw BrokerRoundTripError(fmt::format(
          "Error while polling for a message: {}", Result.ErrorString));
    case Kafka::PollStatus::EndOfPartition:
    case Kafka::PollStatus::TimedOut:
      break;
    }
  }
}

std::pair<std::int64_t, std::int64_t> Consumer::getWatermarks() {
  ConnectionLease Lease(Conn);
  auto &Handle = Lease.handle();
  auto Topic = Config.Topic;
  auto Partition = Config.partition();
  auto Timeout = Settings.WatermarkTimeout;
  return Executor
      .run([&Handle, Topic, Partition, Timeout]() {
        return Handle.queryWatermarkOffsets(Topic, Partition, Timeout);
      })
      .get();
}

MessageStream Consumer::stream() {
  return {ConnectionLease(Conn), Settings.PollTimeout, idleLimit(),
          StreamClock};
}

void Consumer::forEach(std::function<void(Message const &)> const &Handler) {
  auto Messages = stream();
  std::size_t Count{0};
  while (auto Msg = Messages.next()) {
    Handler(*Msg);
    ++Count;
  }
  Logger::Debug("Stream ended after {} message(s).", Count);
}

} // namespace Kafcat
