// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "RdKafkaConsumer.h"
#include "Errors.h"
#include "TimeUtility.h"
#include "logger.h"
#include <atomic>

namespace Kafka {

namespace {
Kafcat::Bytes copyBytes(void const *Data, std::size_t Size) {
  if (Data == nullptr || Size == 0) {
    return {};
  }
  auto const *Begin = static_cast<unsigned char const *>(Data);
  return {Begin, Begin + Size};
}

int toTimeoutMs(duration Timeout) {
  return static_cast<int>(toMilliSeconds(Timeout));
}
} // namespace

PollResult toPollResult(RdKafka::Message &KafkaMessage) {
  switch (KafkaMessage.err()) {
  case RdKafka::ERR_NO_ERROR: {
    Kafcat::Message Msg(
        copyBytes(KafkaMessage.key_pointer(), KafkaMessage.key_len()),
        copyBytes(KafkaMessage.payload(), KafkaMessage.len()),
        KafkaMessage.timestamp().timestamp);
    auto *KafkaHeaders = KafkaMessage.headers();
    if (KafkaHeaders != nullptr) {
      Kafcat::Headers MessageHeaders;
      for (auto const &Header : KafkaHeaders->get_all()) {
        MessageHeaders[Header.key()] =
            copyBytes(Header.value(), Header.value_size());
      }
      Msg.setHeaders(std::move(MessageHeaders));
    }
    return {PollStatus::Message, std::move(Msg), ""};
  }
  case RdKafka::ERR__TIMED_OUT:
    // No message or event within time out - this is usually normal (see
    // librdkafka docs)
    return {PollStatus::TimedOut, {}, ""};
  case RdKafka::ERR__PARTITION_EOF:
    // No more messages on the partition
    return {PollStatus::EndOfPartition, {}, ""};
  default:
    // Everything else is an error
    return {PollStatus::Error, {}, KafkaMessage.errstr()};
  }
}

RdKafkaConsumer::RdKafkaConsumer(
    std::unique_ptr<RdKafka::KafkaConsumer> RdConsumer,
    std::unique_ptr<RdKafka::Conf> RdConf,
    std::unique_ptr<KafkaEventCb> EventCb)
    : Conf(std::move(RdConf)), EventCallback(std::move(EventCb)),
      KafkaConsumer(std::move(RdConsumer)) {
  static std::atomic<int> ConsumerInstanceCount;
  id = ConsumerInstanceCount++;
}

RdKafkaConsumer::~RdKafkaConsumer() {
  if (KafkaConsumer != nullptr) {
    Logger::Debug("Closing consumer {}.", id);
    KafkaConsumer->unassign();
    KafkaConsumer->close();
  }
}

void RdKafkaConsumer::assign(std::string const &Topic, int Partition,
                             std::int64_t Offset) {
  Logger::Debug("Consumer {} assigning topic: {}, partition: {}, offset: {}",
                id, Topic, Partition, Offset);
  std::vector<RdKafka::TopicPartition *> Assignments{
      RdKafka::TopicPartition::create(Topic, Partition, Offset)};
  auto ReturnCode = KafkaConsumer->assign(Assignments);
  RdKafka::TopicPartition::destroy(Assignments);
  if (ReturnCode != RdKafka::ERR_NO_ERROR) {
    Logger::Error("Could not assign to {}", Topic);
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Could not assign topic-partition of topic {}, RdKafka error: "{}")",
        Topic, RdKafka::err2str(ReturnCode)));
  }
}

PollResult RdKafkaConsumer::poll(duration Timeout) {
  auto KafkaMsg = std::unique_ptr<RdKafka::Message>(
      KafkaConsumer->consume(toTimeoutMs(Timeout)));
  return toPollResult(*KafkaMsg);
}

std::pair<std::int64_t, std::int64_t>
RdKafkaConsumer::queryWatermarkOffsets(std::string const &Topic,
                                       int Partition, duration Timeout) {
  std::int64_t Low{0};
  std::int64_t High{0};
  auto ErrorCode = KafkaConsumer->query_watermark_offsets(
      Topic, Partition, &Low, &High, toTimeoutMs(Timeout));
  if (ErrorCode != RdKafka::ERR_NO_ERROR) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Could not get watermarks of topic "{}" partition {}. RdKafka error: "{}")",
        Topic, Partition, RdKafka::err2str(ErrorCode)));
  }
  return {Low, High};
}

std::vector<TopicPartitionOffset>
RdKafkaConsumer::offsetsForTimes(std::string const &Topic, int Partition,
                                 std::int64_t TimestampMs, duration Timeout) {
  std::vector<RdKafka::TopicPartition *> TopicPartitions{
      RdKafka::TopicPartition::create(Topic, Partition, TimestampMs)};
  auto ErrorCode =
      KafkaConsumer->offsetsForTimes(TopicPartitions, toTimeoutMs(Timeout));
  if (ErrorCode != RdKafka::ERR_NO_ERROR) {
    RdKafka::TopicPartition::destroy(TopicPartitions);
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Could not get offsets in topic "{}" for the timestamp {}. RdKafka error: "{}")",
        Topic, TimestampMs, RdKafka::err2str(ErrorCode)));
  }
  std::vector<TopicPartitionOffset> Result;
  for (auto const *Entry : TopicPartitions) {
    std::string Error;
    if (Entry->err() != RdKafka::ERR_NO_ERROR) {
      Error = RdKafka::err2str(Entry->err());
    }
    Result.push_back({Entry->topic(), Entry->partition(), Entry->offset(),
                      Error});
  }
  RdKafka::TopicPartition::destroy(TopicPartitions);
  return Result;
}

} // namespace Kafka
