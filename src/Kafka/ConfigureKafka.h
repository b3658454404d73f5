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
#include <librdkafka/rdkafkacpp.h>
#include <memory>

namespace Kafka {
/// Apply the settings to a librdkafka configuration, sensitive values are
/// not logged.
///
/// \throws Kafcat::ConfigurationError if librdkafka rejects a setting.
void configureKafka(RdKafka::Conf &RdKafkaConfiguration,
                    Kafka::BrokerSettings const &Settings);

/// Global configuration with broker list, event callback and settings set.
std::unique_ptr<RdKafka::Conf> createConfiguration(BrokerSettings const &Settings,
                                                   RdKafka::EventCb *EventCb);
} // namespace Kafka
