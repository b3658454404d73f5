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
#include "logger.h"
#include <map>
#include <string>
#include <vector>

// Forward declarations
namespace CLI {
class App;
class Option;
} // namespace CLI

/// Values collected from the command line.
struct KafcatOptions {
  std::vector<std::string> Brokers;
  std::string SecurityProtocol{"plaintext"};
  Kafcat::TlsConfig Tls;
  std::map<std::string, std::string> KafkaProperties;
  LogSeverity LoggingLevel{LogSeverity::Warn};
  std::string LogFile;

  std::string Topic;
  std::string FromTopic;
  std::string ToTopic;
  int Partition{0};
  std::string GroupId;
  std::string Offset{"beginning"};
  bool ExitOnDone{false};
  std::string Format{"text"};
  std::string KeyDelimiter;
  int Partitions{1};
};

/// Add the global options and the subcommands to \p App.
void setCLIOptions(CLI::App &App, KafcatOptions &Options);

/// Use for adding repeatable KEY VALUE options.
CLI::Option *addKafkaOption(CLI::App &App, std::string const &Name,
                            std::map<std::string, std::string> &ConfigMap,
                            std::string const &Description);

/// \brief Parsing log level from user's input.
/// Look for \p LogLevelString value in a map containing spdlog levels.
/// \param LogLevelString User's input
/// \param LogLevelResult Result of parsing returned through reference
/// \return bool signalizing successful parsing
bool parseLogLevel(std::vector<std::string> LogLevelString,
                   LogSeverity &LogLevelResult);

/// Brokers may be given as comma separated lists, repeatedly.
/// \throws Kafcat::ConfigurationError on an unknown security protocol.
Kafcat::AuthConfig toAuthConfig(KafcatOptions const &Options);

Kafcat::ConsumerConfig toConsumerConfig(KafcatOptions const &Options,
                                        std::string const &Topic);

Kafcat::ProducerConfig toProducerConfig(KafcatOptions const &Options,
                                        std::string const &Topic);
