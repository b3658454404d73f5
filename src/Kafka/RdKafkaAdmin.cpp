// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "RdKafkaAdmin.h"
#include "ConfigureKafka.h"
#include "Errors.h"
#include "TimeUtility.h"
#include "logger.h"
#include <array>
#include <librdkafka/rdkafka.h>

namespace Kafka {

namespace {
struct NewTopicDeleter {
  void operator()(rd_kafka_NewTopic_t *Ptr) const {
    rd_kafka_NewTopic_destroy(Ptr);
  }
};
struct AdminOptionsDeleter {
  void operator()(rd_kafka_AdminOptions_t *Ptr) const {
    rd_kafka_AdminOptions_destroy(Ptr);
  }
};
struct QueueDeleter {
  void operator()(rd_kafka_queue_t *Ptr) const { rd_kafka_queue_destroy(Ptr); }
};
struct EventDeleter {
  void operator()(rd_kafka_event_t *Ptr) const { rd_kafka_event_destroy(Ptr); }
};
} // namespace

RdKafkaAdmin::RdKafkaAdmin(BrokerSettings const &Settings) {
  Conf = createConfiguration(Settings, &EventCb);
  std::string ErrorString;
  Client = std::unique_ptr<RdKafka::Producer>(
      RdKafka::Producer::create(Conf.get(), ErrorString));
  if (Client == nullptr) {
    Logger::Error("Can not create Kafka admin client: {}", ErrorString);
    throw Kafcat::ConnectionError(
        fmt::format("Can not create Kafka admin client: {}", ErrorString));
  }
}

void RdKafkaAdmin::createTopic(std::string const &Name, int Partitions,
                               int ReplicationFactor, duration Timeout) {
  auto TimeoutMs = static_cast<int>(toMilliSeconds(Timeout));
  std::array<char, 512> ErrorString{};
  auto *Handle = Client->c_ptr();

  auto NewTopic = std::unique_ptr<rd_kafka_NewTopic_t, NewTopicDeleter>(
      rd_kafka_NewTopic_new(Name.c_str(), Partitions, ReplicationFactor,
                            ErrorString.data(), ErrorString.size()));
  if (NewTopic == nullptr) {
    throw Kafcat::BrokerRoundTripError(
        fmt::format(R"(Invalid topic "{}": {})", Name, ErrorString.data()));
  }

  auto Options = std::unique_ptr<rd_kafka_AdminOptions_t, AdminOptionsDeleter>(
      rd_kafka_AdminOptions_new(Handle, RD_KAFKA_ADMIN_OP_CREATETOPICS));
  if (rd_kafka_AdminOptions_set_operation_timeout(
          Options.get(), TimeoutMs, ErrorString.data(), ErrorString.size()) !=
      RD_KAFKA_RESP_ERR_NO_ERROR) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        "Unable to set admin operation timeout: {}", ErrorString.data()));
  }

  auto Queue =
      std::unique_ptr<rd_kafka_queue_t, QueueDeleter>(rd_kafka_queue_new(Handle));
  std::array<rd_kafka_NewTopic_t *, 1> NewTopics{NewTopic.get()};
  rd_kafka_CreateTopics(Handle, NewTopics.data(), NewTopics.size(),
                        Options.get(), Queue.get());

  // Allow for the request round trip on top of the broker side timeout.
  auto Event = std::unique_ptr<rd_kafka_event_t, EventDeleter>(
      rd_kafka_queue_poll(Queue.get(), TimeoutMs + 2000));
  if (Event == nullptr) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Timed out waiting for creation of topic "{}".)", Name));
  }
  if (rd_kafka_event_error(Event.get()) != RD_KAFKA_RESP_ERR_NO_ERROR) {
    throw Kafcat::BrokerRoundTripError(
        fmt::format(R"(Unable to create topic "{}": {})", Name,
                    rd_kafka_event_error_string(Event.get())));
  }
  auto const *Result = rd_kafka_event_CreateTopics_result(Event.get());
  if (Result == nullptr) {
    throw Kafcat::BrokerRoundTripError(fmt::format(
        R"(Unexpected response to creation of topic "{}".)", Name));
  }
  std::size_t TopicCount{0};
  auto const **Topics = rd_kafka_CreateTopics_result_topics(Result, &TopicCount);
  for (std::size_t i = 0; i < TopicCount; ++i) {
    auto ErrorCode = rd_kafka_topic_result_error(Topics[i]);
    if (ErrorCode != RD_KAFKA_RESP_ERR_NO_ERROR) {
      auto const *Reason = rd_kafka_topic_result_error_string(Topics[i]);
      throw Kafcat::BrokerRoundTripError(fmt::format(
          R"(Unable to create topic "{}": {})", Name,
          Reason != nullptr ? Reason : rd_kafka_err2str(ErrorCode)));
    }
  }
  Logger::Info(R"(Created topic "{}" with {} partition(s).)", Name, Partitions);
}

} // namespace Kafka
