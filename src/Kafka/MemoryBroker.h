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
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <tuple>

namespace Kafka {

/// \brief Topics, partitions and committed offsets held in process memory.
///
/// Stands in for a Kafka cluster in tests. Offsets start at 0 in every
/// partition and are never compacted, so the low watermark is always 0.
class MemoryBroker {
public:
  /// \throws Kafcat::BrokerRoundTripError if the topic exists, the partition
  /// count is not positive or the broker is unreachable.
  void createTopic(std::string const &Name, int Partitions);

  bool hasTopic(std::string const &Name) const;

  int partitionCount(std::string const &Topic) const;

  /// Append to a partition, creating the topic with a single partition if it
  /// does not exist.
  /// \return Offset of the new record.
  std::int64_t append(std::string const &Topic, int Partition,
                      Kafcat::Message Msg);

  /// \return Message at \p Offset, if there is one.
  std::optional<Kafcat::Message> read(std::string const &Topic, int Partition,
                                      std::int64_t Offset) const;

  /// Block until the partition holds a record at \p Offset or \p Timeout has
  /// passed.
  bool waitFor(std::string const &Topic, int Partition, std::int64_t Offset,
               duration Timeout) const;

  /// \throws Kafcat::BrokerRoundTripError for unknown partitions.
  std::pair<std::int64_t, std::int64_t>
  watermarks(std::string const &Topic, int Partition) const;

  /// \return First offset with a timestamp at or after \p TimestampMs, -1 if
  /// there is none.
  /// \throws Kafcat::BrokerRoundTripError for unknown partitions.
  std::int64_t offsetForTime(std::string const &Topic, int Partition,
                             std::int64_t TimestampMs) const;

  void commit(std::string const &Group, std::string const &Topic,
              int Partition, std::int64_t Offset);

  std::optional<std::int64_t> committed(std::string const &Group,
                                        std::string const &Topic,
                                        int Partition) const;

  /// Make every broker round trip fail while set.
  void setUnreachable(bool Unreachable);
  bool isUnreachable() const;

  /// Throw Kafcat::BrokerRoundTripError if the broker is unreachable.
  void requireReachable(std::string const &Operation) const;

  /// Partition a produced record goes to.
  int choosePartition(std::string const &Topic,
                      std::optional<Kafcat::Bytes> const &Key);

private:
  using Partition = std::vector<Kafcat::Message>;
  Partition const &getPartition(std::string const &Topic,
                                int PartitionId) const;

  mutable std::mutex Mutex;
  mutable std::condition_variable NewData;
  std::map<std::string, std::vector<Partition>> Topics;
  std::map<std::tuple<std::string, std::string, int>, std::int64_t>
      CommittedOffsets;
  std::map<std::string, int> RoundRobin;
  bool Unreachable{false};
};

class MemoryConsumer : public ConsumerHandle {
public:
  MemoryConsumer(std::shared_ptr<MemoryBroker> Broker,
                 BrokerSettings const &Settings);

  void assign(std::string const &Topic, int Partition,
              std::int64_t Offset) override;

  PollResult poll(duration Timeout) override;

  std::pair<std::int64_t, std::int64_t>
  queryWatermarkOffsets(std::string const &Topic, int Partition,
                        duration Timeout) override;

  std::vector<TopicPartitionOffset>
  offsetsForTimes(std::string const &Topic, int Partition,
                  std::int64_t TimestampMs, duration Timeout) override;

private:
  std::int64_t startPosition(std::int64_t Offset) const;

  std::shared_ptr<MemoryBroker> Broker;
  std::string GroupId;
  bool ReportEndOfPartition{false};
  bool AtEndOfPartition{false};

  struct Assignment {
    std::string Topic;
    int Partition{0};
    std::int64_t RequestedOffset{0};
    std::optional<std::int64_t> Position;
  };
  std::optional<Assignment> Assigned;
};

class MemoryProducer : public ProducerHandle {
public:
  explicit MemoryProducer(std::shared_ptr<MemoryBroker> Broker);

  void produce(ProducerRecord const &Record,
               DeliveryCallback OnDelivery) override;

  int poll(duration Timeout) override;

  int outputQueueLength() override;

private:
  std::shared_ptr<MemoryBroker> Broker;
  std::mutex Mutex;
  std::vector<std::pair<DeliveryCallback, DeliveryResult>> PendingReports;
};

class MemoryAdmin : public AdminHandle {
public:
  explicit MemoryAdmin(std::shared_ptr<MemoryBroker> Broker);

  void createTopic(std::string const &Name, int Partitions,
                   int ReplicationFactor, duration Timeout) override;

private:
  std::shared_ptr<MemoryBroker> Broker;
};

/// Creates handles on a shared MemoryBroker and records the settings they
/// were created with.
class MemoryClientFactory : public ClientFactoryInterface {
public:
  explicit MemoryClientFactory(std::shared_ptr<MemoryBroker> Broker);

  std::unique_ptr<ConsumerHandle>
  createConsumer(BrokerSettings const &Settings) override;
  std::unique_ptr<ProducerHandle>
  createProducer(BrokerSettings const &Settings) override;
  std::unique_ptr<AdminHandle>
  createAdmin(BrokerSettings const &Settings) override;

  std::vector<BrokerSettings> CreatedWith;

private:
  std::shared_ptr<MemoryBroker> Broker;
};

} // namespace Kafka
