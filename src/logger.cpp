// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "logger.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> Logger::instance() {
  // Messages go to stdout, so diagnostics are kept on stderr.
  static auto stderr_logger = spdlog::stderr_color_mt("kafcat");
  return stderr_logger;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogSeverity Severity) {
  switch (Severity) {
  case LogSeverity::Critical:
    return spdlog::level::critical;
  case LogSeverity::Error:
    return spdlog::level::err;
  case LogSeverity::Warn:
    return spdlog::level::warn;
  case LogSeverity::Info:
    return spdlog::level::info;
  case LogSeverity::Debug:
    return spdlog::level::debug;
  case LogSeverity::Trace:
    return spdlog::level::trace;
  }
  return spdlog::level::info;
}

void setUpLogging(LogSeverity const &LoggingLevel, std::string const &LogFile) {
  auto logger = Logger::instance();
  if (!LogFile.empty()) {
    logger->sinks().push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(LogFile));
  }
  logger->set_level(Logger::toSpdlogLevel(LoggingLevel));
}
