// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "RdKafkaProducer.h"
#include "ConfigureKafka.h"
#include "Errors.h"
#include "ProducerMessage.h"
#include "TimeUtility.h"
#include "logger.h"

namespace Kafka {

RdKafkaProducer::RdKafkaProducer(BrokerSettings const &Settings)
    : ProducerBrokerSettings(Settings) {
  Conf = createConfiguration(ProducerBrokerSettings, &EventCb);
  std::string ErrorString;
  if (Conf->set("dr_cb", &DeliveryCb, ErrorString) !=
      RdKafka::Conf::CONF_OK) {
    throw Kafcat::ConfigurationError(fmt::format(
        "Unable to set Kafka delivery report callback: {}", ErrorString));
  }
  ProducerPtr = std::unique_ptr<RdKafka::Producer>(
      RdKafka::Producer::create(Conf.get(), ErrorString));
  if (ProducerPtr == nullptr) {
    Logger::Error("Can not create Kafka producer: {}", ErrorString);
    throw Kafcat::ConnectionError(
        fmt::format("Can not create Kafka producer: {}", ErrorString));
  }
}

RdKafkaProducer::~RdKafkaProducer() {
  Logger::Debug("~RdKafkaProducer()");
  if (ProducerPtr != nullptr) {
    auto ErrorCode = ProducerPtr->flush(static_cast<int>(
        toMilliSeconds(ProducerBrokerSettings.ProducerFlushTimeout)));
    if (ErrorCode != RdKafka::ERR_NO_ERROR) {
      Logger::Warn("{} message(s) were not delivered before shutdown: {}",
                   ProducerPtr->outq_len(), RdKafka::err2str(ErrorCode));
    }
    // Serve delivery reports of messages flushed above.
    ProducerPtr->poll(0);
  }
  Logger::Debug("Producer stats: produced {} ({} bytes), failed {}, delivered "
                "{}, delivery failures {}",
                Stats.produced.load(), Stats.produced_bytes.load(),
                Stats.produce_fail.load(), Stats.produce_cb.load(),
                Stats.produce_cb_fail.load());
}

void RdKafkaProducer::produce(ProducerRecord const &Record,
                              DeliveryCallback OnDelivery) {
  auto Msg = std::make_unique<ProducerMessage>();
  Msg->Key = Record.Key;
  Msg->Payload = Record.Payload;
  Msg->OnDelivery = std::move(OnDelivery);

  RdKafka::Headers *KafkaHeaders{nullptr};
  if (!Record.MessageHeaders.empty()) {
    KafkaHeaders = RdKafka::Headers::create();
    for (auto const &[Key, Value] : Record.MessageHeaders) {
      KafkaHeaders->add(Key, Value.data(), Value.size());
    }
  }

  // MsgFlags = 0 means that we are responsible for cleaning up the message
  // after it has been sent
  // We do this by providing a pointer to our message object in the produce
  // call, this pointer is returned to us in the delivery callback, at which
  // point we can free the memory
  int MsgFlags = 0;
  auto MsgSize = static_cast<uint64_t>(Msg->payloadSize());
  auto ErrorCode = ProducerPtr->produce(
      Record.Topic, RdKafka::Topic::PARTITION_UA, MsgFlags, Msg->payloadData(),
      Msg->payloadSize(), Msg->keyData(), Msg->keySize(), Record.Timestamp,
      KafkaHeaders, Msg.get());
  switch (ErrorCode) {
  case RdKafka::ERR_NO_ERROR:
    ++Stats.produced;
    Stats.produced_bytes += MsgSize;
    Msg.release(); // we clean up the message after it has been sent, see
                   // comment by MsgFlags declaration
    return;

  case RdKafka::ERR__QUEUE_FULL:
    ++Stats.local_queue_full;
    Logger::Info("Producer queue full, outq: {}", outputQueueLength());
    break;

  case RdKafka::ERR_MSG_SIZE_TOO_LARGE:
    ++Stats.msg_too_large;
    Logger::Error("Message size too large to publish, size: {}", MsgSize);
    break;

  default:
    ++Stats.produce_fail;
    Logger::Error(R"(Publishing message on topic "{}" failed)", Record.Topic);
    break;
  }
  // Headers are only adopted by librdkafka on success.
  delete KafkaHeaders;
  throw Kafcat::BrokerRoundTripError(
      fmt::format(R"(Unable to produce message on topic "{}": {})",
                  Record.Topic, RdKafka::err2str(ErrorCode)));
}

int RdKafkaProducer::poll(duration Timeout) {
  return ProducerPtr->poll(static_cast<int>(toMilliSeconds(Timeout)));
}

int RdKafkaProducer::outputQueueLength() { return ProducerPtr->outq_len(); }

} // namespace Kafka
