// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "OffsetResolver.h"
#include "Errors.h"
#include "logger.h"
#include <algorithm>

namespace Kafcat {

namespace {
void warnIfEndIsSet(std::int64_t End, KafkaOffset const &Offset) {
  if (End != UnboundedEnd) {
    Logger::Warn("End of offset range \"{}\" is not supported and will be "
                 "ignored.",
                 toString(Offset));
  }
}

std::int64_t lookUpTime(std::int64_t TimestampMs, std::string const &Topic,
                        int Partition, Kafka::ConsumerHandle &Handle,
                        ThreadedExecutor &Executor, Kafka::duration Timeout) {
  auto Response = Executor
                      .run([&Handle, Topic, Partition, TimestampMs, Timeout]() {
                        return Handle.offsetsForTimes(Topic, Partition,
                                                      TimestampMs, Timeout);
                      })
                      .get();
  auto Entry = std::find_if(
      Response.begin(), Response.end(),
      [&Topic, Partition](Kafka::TopicPartitionOffset const &Candidate) {
        return Candidate.Topic == Topic && Candidate.Partition == Partition;
      });
  if (Entry == Response.end()) {
    throw InvariantViolation(fmt::format(
        R"(Offsets for times response does not contain "{}" partition {}.)",
        Topic, Partition));
  }
  if (!Entry->Error.empty()) {
    Logger::Error(R"(Offset lookup for "{}" partition {} failed: {})", Topic,
                  Partition, Entry->Error);
    throw BrokerRoundTripError(
        fmt::format(R"(Offset lookup for "{}" partition {} failed: {})", Topic,
                    Partition, Entry->Error));
  }
  Logger::Debug(R"(Timestamp {} in "{}" partition {} resolved to offset {})",
                TimestampMs, Topic, Partition, Entry->Offset);
  return Entry->Offset;
}
} // namespace

std::int64_t resolveOffset(KafkaOffset const &Offset, std::string const &Topic,
                           int Partition, Kafka::ConsumerHandle &Handle,
                           ThreadedExecutor &Executor,
                           Kafka::duration Timeout) {
  if (std::holds_alternative<OffsetBeginning>(Offset)) {
    return ConcreteOffset::Beginning;
  }
  if (std::holds_alternative<OffsetEnd>(Offset)) {
    return ConcreteOffset::End;
  }
  if (std::holds_alternative<OffsetStored>(Offset)) {
    return ConcreteOffset::Stored;
  }
  if (auto const *Value = std::get_if<OffsetValue>(&Offset)) {
    if (Value->Value >= 0) {
      return Value->Value;
    }
    if (Value->Value < ConcreteOffset::MinTailValue) {
      throw ConfigurationError(fmt::format(
          R"(Offset {} counts further back than {} messages.)", Value->Value,
          ConcreteOffset::MaxTailCount + 1));
    }
    return ConcreteOffset::fromTail(-Value->Value - 1);
  }
  if (auto const *Interval = std::get_if<OffsetInterval>(&Offset)) {
    if (Interval->Begin < 0) {
      throw ConfigurationError(fmt::format(
          R"(Offset interval "{}" has a negative beginning.)",
          toString(Offset)));
    }
    warnIfEndIsSet(Interval->End, Offset);
    return Interval->Begin;
  }
  auto const &Interval = std::get<TimeInterval>(Offset);
  warnIfEndIsSet(Interval.EndMs, Offset);
  return lookUpTime(Interval.BeginMs, Topic, Partition, Handle, Executor,
                    Timeout);
}

} // namespace Kafcat
