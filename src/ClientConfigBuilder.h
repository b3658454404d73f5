// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "Configs.h"
#include "Kafka/BrokerSettings.h"

namespace Kafcat {

/// \brief Map the connection and security configuration to client engine
/// settings.
///
/// Pure mapping, no files are read and no connection is made.
/// \throws NotImplementedError for the SASL security protocols.
/// \throws ConfigurationError if there are no brokers, if TLS material is
/// missing for SSL or if a pass-through property tries to override the
/// security settings.
Kafka::BrokerSettings buildBrokerSettings(AuthConfig const &Auth);

/// Settings for a manually assigned consumer that never commits offsets.
Kafka::BrokerSettings buildConsumerSettings(ConsumerConfig const &Config);

Kafka::BrokerSettings buildProducerSettings(ProducerConfig const &Config);

Kafka::BrokerSettings buildAdminSettings(AuthConfig const &Auth);

/// \throws ConfigurationError on unknown protocol names.
SecurityProtocol parseSecurityProtocol(std::string const &Name);

} // namespace Kafcat
