// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "KafkaOffset.h"
#include "Errors.h"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <regex>

namespace Kafcat {

namespace {

std::int64_t toOffsetNumber(std::string const &Text,
                            std::string const &FullText) {
  try {
    return std::stoll(Text);
  } catch (std::out_of_range const &) {
    throw ConfigurationError(
        fmt::format(R"(Offset value out of range in "{}".)", FullText));
  }
}

std::int64_t endOrUnbounded(std::ssub_match const &Match,
                            std::string const &FullText) {
  if (!Match.matched || Match.length() == 0) {
    return UnboundedEnd;
  }
  return toOffsetNumber(Match.str(), FullText);
}

} // namespace

KafkaOffset parseKafkaOffset(std::string const &Text) {
  auto Lower = Text;
  std::transform(Lower.begin(), Lower.end(), Lower.begin(),
                 [](unsigned char C) { return std::tolower(C); });
  if (Lower == "beginning") {
    return OffsetBeginning{};
  }
  if (Lower == "end") {
    return OffsetEnd{};
  }
  if (Lower == "stored") {
    return OffsetStored{};
  }

  std::regex const ValueRegex{R"(^(-?\d+)$)"};
  std::regex const OffsetIntervalRegex{R"(^(\d+)\.\.(\d*)$)"};
  std::regex const TimeIntervalRegex{R"(^s@(\d+)(?:\.\.e@(\d+))?$)"};
  std::smatch Match;
  if (std::regex_match(Lower, Match, ValueRegex)) {
    auto Value = toOffsetNumber(Match[1], Text);
    if (Value < ConcreteOffset::MinTailValue) {
      throw ConfigurationError(fmt::format(
          R"(Offset "{}" counts further back than {} messages.)", Text,
          ConcreteOffset::MaxTailCount + 1));
    }
    return OffsetValue{Value};
  }
  if (std::regex_match(Lower, Match, OffsetIntervalRegex)) {
    OffsetInterval Interval{toOffsetNumber(Match[1], Text),
                            endOrUnbounded(Match[2], Text)};
    if (Interval.End < Interval.Begin) {
      throw ConfigurationError(fmt::format(
          R"(End of offset interval "{}" is before its beginning.)", Text));
    }
    return Interval;
  }
  if (std::regex_match(Lower, Match, TimeIntervalRegex)) {
    TimeInterval Interval{toOffsetNumber(Match[1], Text),
                          endOrUnbounded(Match[2], Text)};
    if (Interval.EndMs < Interval.BeginMs) {
      throw ConfigurationError(fmt::format(
          R"(End of time interval "{}" is before its beginning.)", Text));
    }
    return Interval;
  }
  throw ConfigurationError(fmt::format(
      R"(Unable to parse offset "{}". Expected one of beginning, end, stored, <n>, <begin>..<end> or s@<ms>..e@<ms>.)",
      Text));
}

namespace {
struct OffsetToString {
  std::string operator()(OffsetBeginning const &) const {
    return "beginning";
  }
  std::string operator()(OffsetEnd const &) const { return "end"; }
  std::string operator()(OffsetStored const &) const { return "stored"; }
  std::string operator()(OffsetValue const &Offset) const {
    return std::to_string(Offset.Value);
  }
  std::string operator()(OffsetInterval const &Offset) const {
    if (Offset.End == UnboundedEnd) {
      return fmt::format("{}..", Offset.Begin);
    }
    return fmt::format("{}..{}", Offset.Begin, Offset.End);
  }
  std::string operator()(TimeInterval const &Offset) const {
    if (Offset.EndMs == UnboundedEnd) {
      return fmt::format("s@{}", Offset.BeginMs);
    }
    return fmt::format("s@{}..e@{}", Offset.BeginMs, Offset.EndMs);
  }
};
} // namespace

std::string toString(KafkaOffset const &Offset) {
  return std::visit(OffsetToString{}, Offset);
}

} // namespace Kafcat
