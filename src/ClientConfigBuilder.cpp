// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "ClientConfigBuilder.h"
#include "Errors.h"
#include "helper.h"
#include "logger.h"
#include <algorithm>
#include <array>
#include <cctype>

namespace Kafcat {

namespace {
std::array<std::string, 4> const ProtectedProperties{
    "security.protocol", "ssl.ca.location", "ssl.certificate.location",
    "ssl.key.location"};

void requirePath(std::string const &Path, std::string const &Name) {
  if (Path.empty()) {
    throw ConfigurationError(fmt::format(
        "The SSL security protocol requires a {} but none was given.", Name));
  }
}
} // namespace

std::string toString(SecurityProtocol Protocol) {
  switch (Protocol) {
  case SecurityProtocol::Plaintext:
    return "plaintext";
  case SecurityProtocol::SaslPlaintext:
    return "sasl_plaintext";
  case SecurityProtocol::Ssl:
    return "ssl";
  case SecurityProtocol::SaslSsl:
    return "sasl_ssl";
  }
  return "unknown";
}

SecurityProtocol parseSecurityProtocol(std::string const &Name) {
  auto Lower = Name;
  std::transform(Lower.begin(), Lower.end(), Lower.begin(),
                 [](unsigned char C) { return std::tolower(C); });
  for (auto Protocol :
       {SecurityProtocol::Plaintext, SecurityProtocol::SaslPlaintext,
        SecurityProtocol::Ssl, SecurityProtocol::SaslSsl}) {
    if (Lower == toString(Protocol)) {
      return Protocol;
    }
  }
  throw ConfigurationError(
      fmt::format(R"(Unknown security protocol "{}".)", Name));
}

Kafka::BrokerSettings buildBrokerSettings(AuthConfig const &Auth) {
  if (Auth.Protocol == SecurityProtocol::SaslPlaintext ||
      Auth.Protocol == SecurityProtocol::SaslSsl) {
    throw NotImplementedError(
        fmt::format(R"(Security protocol "{}" is not implemented.)",
                    toString(Auth.Protocol)));
  }
  if (Auth.Brokers.empty()) {
    throw ConfigurationError("No Kafka brokers were given.");
  }

  Kafka::BrokerSettings Settings;
  Settings.Address = joinStrings(Auth.Brokers, ",");
  Settings.KafkaConfiguration["security.protocol"] = toString(Auth.Protocol);

  if (Auth.Protocol == SecurityProtocol::Ssl) {
    if (!Auth.Tls.has_value()) {
      throw ConfigurationError(
          "The SSL security protocol requires TLS settings but none were "
          "given.");
    }
    requirePath(Auth.Tls->CaFile, "CA file");
    requirePath(Auth.Tls->ClientCertFile, "client certificate file");
    requirePath(Auth.Tls->ClientKeyFile, "client key file");
    Settings.KafkaConfiguration["ssl.ca.location"] = Auth.Tls->CaFile;
    Settings.KafkaConfiguration["ssl.certificate.location"] =
        Auth.Tls->ClientCertFile;
    Settings.KafkaConfiguration["ssl.key.location"] = Auth.Tls->ClientKeyFile;
  }

  for (auto const &[Key, Value] : Auth.KafkaProperties) {
    if (std::find(ProtectedProperties.begin(), ProtectedProperties.end(),
                  Key) != ProtectedProperties.end()) {
      throw ConfigurationError(fmt::format(
          R"(Kafka property "{}" can only be set through the security options.)",
          Key));
    }
    Settings.KafkaConfiguration[Key] = Value;
  }
  return Settings;
}

Kafka::BrokerSettings buildConsumerSettings(ConsumerConfig const &Config) {
  auto Settings = buildBrokerSettings(Config.Auth);
  auto GroupId = Config.GroupId;
  if (GroupId.empty()) {
    GroupId = fmt::format("kafcat--host:{}--pid:{}", getHostName(), getPID());
    Logger::Debug("No consumer group given, using \"{}\".", GroupId);
  }
  Settings.KafkaConfiguration["group.id"] = GroupId;
  Settings.KafkaConfiguration["enable.partition.eof"] = "false";
  Settings.KafkaConfiguration["session.timeout.ms"] = "6000";
  Settings.KafkaConfiguration["enable.auto.commit"] = "false";
  return Settings;
}

Kafka::BrokerSettings buildProducerSettings(ProducerConfig const &Config) {
  auto Settings = buildBrokerSettings(Config.Auth);
  Settings.KafkaConfiguration["message.timeout.ms"] = "5000";
  return Settings;
}

Kafka::BrokerSettings buildAdminSettings(AuthConfig const &Auth) {
  return buildBrokerSettings(Auth);
}

} // namespace Kafcat
