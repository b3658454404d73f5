// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include <regex>

#include "ConfigureKafka.h"
#include "Errors.h"
#include <logger.h>

namespace Kafka {
void configureKafka(RdKafka::Conf &RdKafkaConfiguration,
                    Kafka::BrokerSettings const &Settings) {
  std::string ErrorString;
  const std::regex RegexSensitiveKey(
      R"(ssl_key|.+password|.+secret|.+key\.pem|ssl\.key\.location)");
  std::string DebugOutput;

  for (const auto &[Key, Value] : Settings.KafkaConfiguration) {
    const auto IsSensitive = std::regex_match(Key, RegexSensitiveKey);
    const auto LogValue = IsSensitive ? "<REDACTED>" : Value;

    if (RdKafka::Conf::ConfResult::CONF_OK !=
        RdKafkaConfiguration.set(Key, Value, ErrorString)) {
      Logger::Error("Failure setting config: {} = {}", Key, LogValue);
      throw Kafcat::ConfigurationError(fmt::format(
          R"(Kafka rejected setting "{}": {})", Key, ErrorString));
    }
    DebugOutput += fmt::format(" {}={}", Key, LogValue);
  }

  Logger::Debug("RdKafka settings applied:{}", DebugOutput);
}

std::unique_ptr<RdKafka::Conf> createConfiguration(BrokerSettings const &Settings,
                                                   RdKafka::EventCb *EventCb) {
  auto Conf = std::unique_ptr<RdKafka::Conf>(
      RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
  std::string ErrorString;
  if (EventCb != nullptr &&
      Conf->set("event_cb", EventCb, ErrorString) != RdKafka::Conf::CONF_OK) {
    throw Kafcat::ConfigurationError(
        fmt::format("Unable to set Kafka event callback: {}", ErrorString));
  }
  if (Conf->set("metadata.broker.list", Settings.Address, ErrorString) !=
      RdKafka::Conf::CONF_OK) {
    throw Kafcat::ConfigurationError(fmt::format(
        R"(Unable to set broker list "{}": {})", Settings.Address, ErrorString));
  }
  configureKafka(*Conf, Settings);
  return Conf;
}

} // namespace Kafka
