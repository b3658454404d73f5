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
#include "Message.h"
#include "PollStatus.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Kafka {

struct PollResult {
  PollStatus Status{PollStatus::TimedOut};
  Kafcat::Message Msg;
  std::string ErrorString;
};

/// One entry of an offsets-for-times response. A non-empty \p Error marks a
/// partition specific failure.
struct TopicPartitionOffset {
  std::string Topic;
  int Partition{0};
  std::int64_t Offset{0};
  std::string Error;
};

/// Capabilities the consumer needs from a client engine.
///
/// Offsets use the librdkafka encoding for logical positions, see
/// Kafcat::ConcreteOffset.
class ConsumerHandle {
public:
  ConsumerHandle() = default;
  virtual ~ConsumerHandle() = default;

  /// Replace the current assignment with a single partition at \p Offset.
  virtual void assign(std::string const &Topic, int Partition,
                      std::int64_t Offset) = 0;

  /// Wait at most \p Timeout for a message.
  virtual PollResult poll(duration Timeout) = 0;

  /// \return Low and high watermark.
  /// \throws Kafcat::BrokerRoundTripError on failure or timeout.
  virtual std::pair<std::int64_t, std::int64_t>
  queryWatermarkOffsets(std::string const &Topic, int Partition,
                        duration Timeout) = 0;

  /// Earliest offset whose timestamp is at or after \p TimestampMs, -1 if
  /// there is none.
  /// \throws Kafcat::BrokerRoundTripError if the request as a whole fails.
  virtual std::vector<TopicPartitionOffset>
  offsetsForTimes(std::string const &Topic, int Partition,
                  std::int64_t TimestampMs, duration Timeout) = 0;
};

struct ProducerRecord {
  std::string Topic;
  std::optional<Kafcat::Bytes> Key;
  std::optional<Kafcat::Bytes> Payload;
  /// Milliseconds since epoch, 0 lets the client assign the time.
  std::int64_t Timestamp{0};
  Kafcat::Headers MessageHeaders;
};

struct DeliveryResult {
  bool Delivered{false};
  std::string Error;
};

using DeliveryCallback = std::function<void(DeliveryResult const &)>;

class ProducerHandle {
public:
  ProducerHandle() = default;
  virtual ~ProducerHandle() = default;

  /// Queue a record, \p OnDelivery is called from poll() once the outcome is
  /// known.
  /// \throws Kafcat::BrokerRoundTripError if the record can not be queued.
  virtual void produce(ProducerRecord const &Record,
                       DeliveryCallback OnDelivery) = 0;

  /// Serve delivery reports.
  /// \return Number of events served.
  virtual int poll(duration Timeout) = 0;

  /// Number of records not yet delivered.
  virtual int outputQueueLength() = 0;
};

class AdminHandle {
public:
  AdminHandle() = default;
  virtual ~AdminHandle() = default;

  /// \throws Kafcat::BrokerRoundTripError if the broker rejects the request
  /// or does not answer in time.
  virtual void createTopic(std::string const &Name, int Partitions,
                           int ReplicationFactor, duration Timeout) = 0;
};

/// Creates connected client handles.
///
/// All methods throw Kafcat::ConnectionError if the client can not be
/// created.
class ClientFactoryInterface {
public:
  virtual ~ClientFactoryInterface() = default;
  virtual std::unique_ptr<ConsumerHandle>
  createConsumer(BrokerSettings const &Settings) = 0;
  virtual std::unique_ptr<ProducerHandle>
  createProducer(BrokerSettings const &Settings) = 0;
  virtual std::unique_ptr<AdminHandle>
  createAdmin(BrokerSettings const &Settings) = 0;
};

} // namespace Kafka
