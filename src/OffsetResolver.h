// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "Kafka/ClientInterfaces.h"
#include "KafkaOffset.h"
#include "ThreadedExecutor.h"

namespace Kafcat {

/// \brief Turn a requested KafkaOffset into a concrete offset for one
/// topic partition.
///
/// Only TimeInterval needs the broker: one offsets-for-times request, run on
/// \p Executor and bounded by \p Timeout.
/// \throws BrokerRoundTripError if the lookup fails.
/// \throws InvariantViolation if the response lacks the requested partition.
std::int64_t resolveOffset(KafkaOffset const &Offset, std::string const &Topic,
                           int Partition, Kafka::ConsumerHandle &Handle,
                           ThreadedExecutor &Executor,
                           Kafka::duration Timeout = std::chrono::seconds(1));

} // namespace Kafcat
