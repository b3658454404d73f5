// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace Kafka {

using duration = std::chrono::system_clock::duration;
using std::chrono_literals::operator""s;
using std::chrono_literals::operator""ms;
/// Collect options used to connect to the broker.
struct BrokerSettings {
  BrokerSettings() = default;
  std::string Address;
  duration PollTimeout{100ms};
  duration OffsetsForTimesTimeout{1s};
  duration WatermarkTimeout{3s};
  duration AdminOperationTimeout{10s};
  duration ProducerFlushTimeout{5s};
  std::map<std::string, std::string> KafkaConfiguration;
};
} // namespace Kafka
