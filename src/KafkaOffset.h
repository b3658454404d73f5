// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace Kafcat {

/// Used as end bound of an interval that has none.
constexpr std::int64_t UnboundedEnd = std::numeric_limits<std::int64_t>::max();

/// Earliest available offset.
struct OffsetBeginning {
  bool operator==(OffsetBeginning const &) const { return true; }
};

/// Next offset to be written.
struct OffsetEnd {
  bool operator==(OffsetEnd const &) const { return true; }
};

/// Last committed offset of the consumer group.
struct OffsetStored {
  bool operator==(OffsetStored const &) const { return true; }
};

/// \brief A raw offset.
///
/// A value of zero or more is an absolute offset. A negative value counts
/// from the tail: -1 is the most recent message, -2 the one before it.
/// Values below ConcreteOffset::MinTailValue are rejected.
struct OffsetValue {
  std::int64_t Value{0};
  bool operator==(OffsetValue const &Other) const {
    return Value == Other.Value;
  }
};

/// \brief Start consuming at \p Begin.
///
/// \note \p End is not acted upon yet, consumption does not stop there.
struct OffsetInterval {
  std::int64_t Begin{0};
  std::int64_t End{UnboundedEnd};
  bool operator==(OffsetInterval const &Other) const {
    return Begin == Other.Begin && End == Other.End;
  }
};

/// \brief Start consuming at the first message with a timestamp of at least
/// \p BeginMs (epoch milliseconds).
///
/// \note \p EndMs is not acted upon yet, consumption does not stop there.
struct TimeInterval {
  std::int64_t BeginMs{0};
  std::int64_t EndMs{UnboundedEnd};
  bool operator==(TimeInterval const &Other) const {
    return BeginMs == Other.BeginMs && EndMs == Other.EndMs;
  }
};

using KafkaOffset = std::variant<OffsetBeginning, OffsetEnd, OffsetStored,
                                 OffsetValue, OffsetInterval, TimeInterval>;

/// Concrete offsets in the encoding understood by the client engines.
namespace ConcreteOffset {
constexpr std::int64_t Beginning = -2;
constexpr std::int64_t End = -1;
constexpr std::int64_t Stored = -1000;
constexpr std::int64_t TailBase = -2000;

/// Largest tail count that still fits the encoding.
constexpr std::int64_t MaxTailCount =
    TailBase - std::numeric_limits<std::int64_t>::min();

/// Most negative raw offset that can be counted from the tail.
constexpr std::int64_t MinTailValue = -MaxTailCount - 1;

/// Offset \p Count messages before the end of the partition.
constexpr std::int64_t fromTail(std::int64_t Count) { return TailBase - Count; }

constexpr bool isFromTail(std::int64_t Offset) { return Offset <= TailBase; }

constexpr std::int64_t tailCount(std::int64_t Offset) {
  return TailBase - Offset;
}
} // namespace ConcreteOffset

/// \brief Parse the textual form of an offset.
///
/// Accepts `beginning`, `end`, `stored`, `<n>`, `<b>..<e>`, `<b>..`,
/// `s@<ms>` and `s@<ms>..e@<ms>`.
/// \throws ConfigurationError if the text can not be parsed.
KafkaOffset parseKafkaOffset(std::string const &Text);

std::string toString(KafkaOffset const &Offset);

} // namespace Kafcat
