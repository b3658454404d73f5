// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "TimeUtility.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

enum class LogSeverity : int {
  Critical = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Debug = 4,
  Trace = 5,
};

template <> struct fmt::formatter<time_point> {
  constexpr auto parse(format_parse_context &ctx) {
    auto it = ctx.begin();
    while (it != ctx.end() && *it != '}') {
      ++it;
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const time_point &TimeStamp, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", toUTCDateTime(TimeStamp));
  }
};

/// \brief Set the log level and, if \p LogFile is not empty, add a file
/// sink next to the stderr sink.
void setUpLogging(LogSeverity const &LoggingLevel,
                  std::string const &LogFile = "");

struct Logger {
  static std::shared_ptr<spdlog::logger> instance();

  template <typename... Args>
  static void Log(LogSeverity Severity, fmt::format_string<Args...> Format,
                  Args &&...args) {
    instance()->log(toSpdlogLevel(Severity), Format,
                    std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Critical(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->critical(Format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Error(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->error(Format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Warn(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->warn(Format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Info(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->info(Format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Debug(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->debug(Format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Trace(fmt::format_string<Args...> Format, Args &&...args) {
    instance()->trace(Format, std::forward<Args>(args)...);
  }

  static spdlog::level::level_enum toSpdlogLevel(LogSeverity Severity);
};
