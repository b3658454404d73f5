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
#include "KafkaEventCb.h"
#include <librdkafka/rdkafkacpp.h>
#include <memory>

namespace Kafka {

/// Translate a consumed librdkafka message.
PollResult toPollResult(RdKafka::Message &KafkaMessage);

class RdKafkaConsumer : public ConsumerHandle {
public:
  /// The constructor
  ///
  /// \param RdConsumer The RdKafka Consumer to wrap.
  /// \param RdConf The Configuration for the RdKafka Consumer.
  /// \param EventCb Callback for each time the consumer is polled.
  RdKafkaConsumer(std::unique_ptr<RdKafka::KafkaConsumer> RdConsumer,
                  std::unique_ptr<RdKafka::Conf> RdConf,
                  std::unique_ptr<KafkaEventCb> EventCb);
  RdKafkaConsumer(RdKafkaConsumer &&) = delete;
  RdKafkaConsumer(RdKafkaConsumer const &) = delete;
  ~RdKafkaConsumer() override;

  /// Previous partition assignments are NOT preserved.
  /// \note This is a non blocking call.
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
  std::unique_ptr<RdKafka::Conf> Conf;
  int id = 0;
  std::unique_ptr<KafkaEventCb> EventCallback;
  std::unique_ptr<RdKafka::KafkaConsumer> KafkaConsumer;
};

} // namespace Kafka
