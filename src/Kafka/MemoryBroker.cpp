// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "MemoryBroker.h"
#include "Errors.h"
#include "KafkaOffset.h"
#include "TimeUtility.h"
#include "logger.h"
#include <algorithm>
#include <thread>

namespace Kafka {

namespace ConcreteOffset = Kafcat::ConcreteOffset;

void MemoryBroker::createTopic(std::string const &Name, int Partitions) {
  requireReachable("create topic");
  if (Partitions < 1) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Invalid partition count {} for topic "{}".)", Partitions, Name));
  }
  std::lock_guard<std::mutex> Lock(Mutex);
  if (Topics.find(Name) != Topics.end()) {
    throw Kafcat::BrokerRoundTripError(
        fmt::format(R"(Topic "{}" already exists.)", Name));
  }
  Topics[Name].resize(static_cast<std::size_t>(Partitions));
}

bool MemoryBroker::hasTopic(std::string const &Name) const {
  std::lock_guard<std::mutex> Lock(Mutex);
  return Topics.find(Name) != Topics.end();
}

int MemoryBroker::partitionCount(std::string const &Topic) const {
  std::lock_guard<std::mutex> Lock(Mutex);
  auto Found = Topics.find(Topic);
  if (Found == Topics.end()) {
    return 0;
  }
  return static_cast<int>(Found->second.size());
}

std::int64_t MemoryBroker::append(std::string const &Topic, int Partition,
                                  Kafcat::Message Msg) {
  std::int64_t Offset{0};
  {
    std::lock_guard<std::mutex> Lock(Mutex);
    auto &Partitions = Topics[Topic];
    if (Partitions.empty()) {
      Partitions.resize(1);
    }
    if (Partition < 0 || Partition >= static_cast<int>(Partitions.size())) {
      throw Kafcat::BrokerRoundTripError(fmt::format(
          R"(Unknown partition {} of topic "{}".)", Partition, Topic));
    }
    auto &Records = Partitions[static_cast<std::size_t>(Partition)];
    Offset = static_cast<std::int64_t>(Records.size());
    Records.push_back(std::move(Msg));
  }
  NewData.notify_all();
  return Offset;
}

MemoryBroker::Partition const &
MemoryBroker::getPartition(std::string const &Topic, int PartitionId) const {
  auto Found = Topics.find(Topic);
  if (Found == Topics.end() || PartitionId < 0 ||
      PartitionId >= static_cast<int>(Found->second.size())) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Unknown topic or partition: "{}" [{}].)", Topic, PartitionId));
  }
  return Found->second[static_cast<std::size_t>(PartitionId)];
}

std::optional<Kafcat::Message> MemoryBroker::read(std::string const &Topic,
                                                  int Partition,
                                                  std::int64_t Offset) const {
  std::lock_guard<std::mutex> Lock(Mutex);
  auto const &Records = getPartition(Topic, Partition);
  if (Offset < 0 || Offset >= static_cast<std::int64_t>(Records.size())) {
    return {};
  }
  return Records[static_cast<std::size_t>(Offset)];
}

bool MemoryBroker::waitFor(std::string const &Topic, int Partition,
                           std::int64_t Offset, duration Timeout) const {
  std::unique_lock<std::mutex> Lock(Mutex);
  return NewData.wait_for(Lock, Timeout, [&]() {
    auto Found = Topics.find(Topic);
    if (Found == Topics.end() || Partition < 0 ||
        Partition >= static_cast<int>(Found->second.size())) {
      return false;
    }
    return Offset < static_cast<std::int64_t>(
                        Found->second[static_cast<std::size_t>(Partition)]
                            .size());
  });
}

std::pair<std::int64_t, std::int64_t>
MemoryBroker::watermarks(std::string const &Topic, int Partition) const {
  requireReachable("query watermarks");
  std::lock_guard<std::mutex> Lock(Mutex);
  auto const &Records = getPartition(Topic, Partition);
  return {0, static_cast<std::int64_t>(Records.size())};
}

std::int64_t MemoryBroker::offsetForTime(std::string const &Topic,
                                         int Partition,
                                         std::int64_t TimestampMs) const {
  requireReachable("query offsets for times");
  std::lock_guard<std::mutex> Lock(Mutex);
  auto const &Records = getPartition(Topic, Partition);
  auto Found = std::find_if(Records.begin(), Records.end(),
                            [TimestampMs](Kafcat::Message const &Msg) {
                              return Msg.getTimestamp() >= TimestampMs;
                            });
  if (Found == Records.end()) {
    return -1;
  }
  return static_cast<std::int64_t>(std::distance(Records.begin(), Found));
}

void MemoryBroker::commit(std::string const &Group, std::string const &Topic,
                          int Partition, std::int64_t Offset) {
  std::lock_guard<std::mutex> Lock(Mutex);
  CommittedOffsets[{Group, Topic, Partition}] = Offset;
}

std::optional<std::int64_t>
MemoryBroker::committed(std::string const &Group, std::string const &Topic,
                        int Partition) const {
  std::lock_guard<std::mutex> Lock(Mutex);
  auto Found = CommittedOffsets.find({Group, Topic, Partition});
  if (Found == CommittedOffsets.end()) {
    return {};
  }
  return Found->second;
}

void MemoryBroker::setUnreachable(bool NewValue) {
  std::lock_guard<std::mutex> Lock(Mutex);
  Unreachable = NewValue;
}

bool MemoryBroker::isUnreachable() const {
  std::lock_guard<std::mutex> Lock(Mutex);
  return Unreachable;
}

void MemoryBroker::requireReachable(std::string const &Operation) const {
  if (isUnreachable()) {
    throw Kafcat::BrokerRoundTripError(
        fmt::format("Unable to {}: broker is unreachable.", Operation));
  }
}

int MemoryBroker::choosePartition(std::string const &Topic,
                                  std::optional<Kafcat::Bytes> const &Key) {
  auto Partitions = std::max(partitionCount(Topic), 1);
  if (Key.has_value()) {
    auto Hash = std::hash<std::string>{}(Kafcat::toString(*Key));
    return static_cast<int>(Hash % static_cast<std::size_t>(Partitions));
  }
  std::lock_guard<std::mutex> Lock(Mutex);
  return RoundRobin[Topic]++ % Partitions;
}

MemoryConsumer::MemoryConsumer(std::shared_ptr<MemoryBroker> Broker,
                               BrokerSettings const &Settings)
    : Broker(std::move(Broker)) {
  auto Found = Settings.KafkaConfiguration.find("group.id");
  if (Found != Settings.KafkaConfiguration.end()) {
    GroupId = Found->second;
  }
  Found = Settings.KafkaConfiguration.find("enable.partition.eof");
  ReportEndOfPartition = Found != Settings.KafkaConfiguration.end() &&
                         Found->second == "true";
}

void MemoryConsumer::assign(std::string const &Topic, int Partition,
                            std::int64_t Offset) {
  Logger::Debug("Memory consumer assigned to {} [{}] at {}", Topic, Partition,
                Offset);
  Assigned = Assignment{Topic, Partition, Offset, std::nullopt};
  AtEndOfPartition = false;
}

std::int64_t MemoryConsumer::startPosition(std::int64_t Offset) const {
  auto [Low, High] = Broker->watermarks(Assigned->Topic, Assigned->Partition);
  if (Offset == ConcreteOffset::Beginning) {
    return Low;
  }
  if (Offset == ConcreteOffset::End) {
    return High;
  }
  if (Offset == ConcreteOffset::Stored) {
    return Broker->committed(GroupId, Assigned->Topic, Assigned->Partition)
        .value_or(High);
  }
  if (ConcreteOffset::isFromTail(Offset)) {
    return std::max(Low, High - ConcreteOffset::tailCount(Offset));
  }
  return std::max(Low, Offset);
}

PollResult MemoryConsumer::poll(duration Timeout) {
  if (!Assigned.has_value()) {
    std::this_thread::sleep_for(Timeout);
    return {PollStatus::TimedOut, {}, ""};
  }
  try {
    if (!Assigned->Position.has_value()) {
      Assigned->Position = startPosition(Assigned->RequestedOffset);
    }
    auto Msg = Broker->read(Assigned->Topic, Assigned->Partition,
                            *Assigned->Position);
    if (!Msg.has_value() &&
        Broker->waitFor(Assigned->Topic, Assigned->Partition,
                        *Assigned->Position, Timeout)) {
      Msg = Broker->read(Assigned->Topic, Assigned->Partition,
                         *Assigned->Position);
    }
    if (Msg.has_value()) {
      ++*Assigned->Position;
      AtEndOfPartition = false;
      return {PollStatus::Message, std::move(*Msg), ""};
    }
  } catch (Kafcat::BrokerRoundTripError const &E) {
    return {PollStatus::Error, {}, E.what()};
  }
  if (ReportEndOfPartition && !AtEndOfPartition) {
    AtEndOfPartition = true;
    return {PollStatus::EndOfPartition, {}, ""};
  }
  return {PollStatus::TimedOut, {}, ""};
}

std::pair<std::int64_t, std::int64_t>
MemoryConsumer::queryWatermarkOffsets(std::string const &Topic, int Partition,
                                      duration) {
  return Broker->watermarks(Topic, Partition);
}

std::vector<TopicPartitionOffset>
MemoryConsumer::offsetsForTimes(std::string const &Topic, int Partition,
                                std::int64_t TimestampMs, duration) {
  Broker->requireReachable("query offsets for times");
  try {
    return {{Topic, Partition,
             Broker->offsetForTime(Topic, Partition, TimestampMs), ""}};
  } catch (Kafcat::BrokerRoundTripError const &E) {
    return {{Topic, Partition, -1, E.what()}};
  }
}

MemoryProducer::MemoryProducer(std::shared_ptr<MemoryBroker> Broker)
    : Broker(std::move(Broker)) {}

void MemoryProducer::produce(ProducerRecord const &Record,
                             DeliveryCallback OnDelivery) {
  DeliveryResult Result;
  if (Broker->isUnreachable()) {
    Result.Error = "Local: Message timed out";
  } else {
    Kafcat::Message Msg;
    if (Record.Key.has_value()) {
      Msg.setKey(*Record.Key);
    }
    if (Record.Payload.has_value()) {
      Msg.setPayload(*Record.Payload);
    }
    Msg.setTimestamp(Record.Timestamp > 0 ? Record.Timestamp
                                          : toMilliSeconds(
                                              std::chrono::system_clock::now()));
    Msg.setHeaders(Record.MessageHeaders);
    Broker->append(Record.Topic,
                   Broker->choosePartition(Record.Topic, Record.Key),
                   std::move(Msg));
    Result.Delivered = true;
  }
  std::lock_guard<std::mutex> Lock(Mutex);
  PendingReports.emplace_back(std::move(OnDelivery), Result);
}

int MemoryProducer::poll(duration) {
  std::vector<std::pair<DeliveryCallback, DeliveryResult>> Reports;
  {
    std::lock_guard<std::mutex> Lock(Mutex);
    Reports.swap(PendingReports);
  }
  for (auto &[Callback, Result] : Reports) {
    if (Callback) {
      Callback(Result);
    }
  }
  return static_cast<int>(Reports.size());
}

int MemoryProducer::outputQueueLength() {
  std::lock_guard<std::mutex> Lock(Mutex);
  return static_cast<int>(PendingReports.size());
}

MemoryAdmin::MemoryAdmin(std::shared_ptr<MemoryBroker> Broker)
    : Broker(std::move(Broker)) {}

void MemoryAdmin::createTopic(std::string const &Name, int Partitions,
                              int ReplicationFactor, duration) {
  if (ReplicationFactor != 1) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        "Replication factor {} is larger than the number of brokers (1).",
        ReplicationFactor));
  }
  Broker->createTopic(Name, Partitions);
}

MemoryClientFactory::MemoryClientFactory(std::shared_ptr<MemoryBroker> Broker)
    : Broker(std::move(Broker)) {}

std::unique_ptr<ConsumerHandle>
MemoryClientFactory::createConsumer(BrokerSettings const &Settings) {
  CreatedWith.push_back(Settings);
  return std::make_unique<MemoryConsumer>(Broker, Settings);
}

std::unique_ptr<ProducerHandle>
MemoryClientFactory::createProducer(BrokerSettings const &Settings) {
  CreatedWith.push_back(Settings);
  return std::make_unique<MemoryProducer>(Broker);
}

std::unique_ptr<AdminHandle>
MemoryClientFactory::createAdmin(BrokerSettings const &Settings) {
  CreatedWith.push_back(Settings);
  return std::make_unique<MemoryAdmin>(Broker);
}

} // namespace Kafka
