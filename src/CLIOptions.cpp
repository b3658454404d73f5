// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "CLIOptions.h"
#include "ClientConfigBuilder.h"
#include "helper.h"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>

std::string addLineBreaks(std::string Input) {
  const unsigned int MaxCharacters{50};
  unsigned int Beginning{0};
  while (Beginning + MaxCharacters < Input.size()) {
    auto CString = Input.substr(Beginning, MaxCharacters);
    auto ModifyLoc = Beginning + CString.find_last_of(' ');
    Input[ModifyLoc] = '\n';
    Beginning = ModifyLoc;
  }
  return Input;
}

CLI::Option *addKafkaOption(CLI::App &App, std::string const &Name,
                            std::map<std::string, std::string> &ConfigMap,
                            std::string const &Description) {
  CLI::callback_t Fun = [&ConfigMap](CLI::results_t Results) {
    for (size_t i = 0; i < Results.size() / 2; i++) {
      ConfigMap[Results.at(i * 2)] = Results.at(i * 2 + 1);
    }
    return true;
  };
  CLI::Option *Opt = App.add_option(Name, Fun, addLineBreaks(Description));
  Opt->type_name("KEY VALUE");
  // -2 => must be a pair (key, value)
  Opt->type_size(-2);
  return Opt;
}

bool parseLogLevel(std::vector<std::string> LogLevelString,
                   LogSeverity &LogLevelResult) {
  auto ToLower = [](auto InString) {
    std::transform(InString.begin(), InString.end(), InString.begin(),
                   [](unsigned char C) { return std::tolower(C); });
    return InString;
  };
  std::map<std::string, LogSeverity> LevelMap{
      {"critical", LogSeverity::Critical}, {"error", LogSeverity::Error},
      {"warning", LogSeverity::Warn},      {"info", LogSeverity::Info},
      {"debug", LogSeverity::Debug},       {"trace", LogSeverity::Trace}};

  if (LogLevelString.size() != 1) {
    return false;
  }
  auto Found = LevelMap.find(ToLower(LogLevelString.at(0)));
  if (Found != LevelMap.end()) {
    LogLevelResult = Found->second;
    return true;
  }
  try {
    int TempLogMessageLevel = std::stoi(LogLevelString.at(0));
    if (TempLogMessageLevel < 0 || TempLogMessageLevel > 5) {
      return false;
    }
    LogLevelResult = LogSeverity(TempLogMessageLevel);
  } catch (std::invalid_argument &) {
    return false;
  } catch (std::out_of_range &) {
    return false;
  }
  return true;
}

namespace {
void addConsumerOptions(CLI::App &Command, KafcatOptions &Options) {
  Command.add_option("-p,--partition", Options.Partition,
                     "Partition to consume from");
  Command.add_option("-g,--group-id", Options.GroupId,
                     "Consumer group, generated from host name and process id "
                     "if not given");
  Command.add_option(
      "-o,--offset", Options.Offset,
      addLineBreaks("Where to start: beginning, end, stored, <n> (negative "
                    "counts from the end), <begin>..<end> or "
                    "s@<ms>..e@<ms>"));
  Command.add_flag("-e,--exit", Options.ExitOnDone,
                   "Exit once no new message arrived for a few seconds");
}

void addFormatOptions(CLI::App &Command, KafcatOptions &Options) {
  Command.add_option("-f,--format", Options.Format, "Message format")
      ->check(CLI::IsMember({"text", "json"}));
  Command.add_option("-K,--key-delimiter", Options.KeyDelimiter,
                     "Delimiter between key and payload in text format");
}
} // namespace

void setCLIOptions(CLI::App &App, KafcatOptions &Options) {
  App.require_subcommand(1);

  App.add_option("-b,--brokers", Options.Brokers,
                 "Comma separated list of Kafka brokers")
      ->required();

  App.add_option("--security-protocol", Options.SecurityProtocol,
                 "Protocol used to communicate with brokers")
      ->check(CLI::IsMember(
          {"plaintext", "ssl", "sasl_plaintext", "sasl_ssl"},
          CLI::ignore_case));
  App.add_option("--ssl-ca-location", Options.Tls.CaFile,
                 "CA certificate file for verifying the broker");
  App.add_option("--ssl-certificate-location", Options.Tls.ClientCertFile,
                 "Client certificate file");
  App.add_option("--ssl-key-location", Options.Tls.ClientKeyFile,
                 "Client private key file");

  addKafkaOption(App, "-X", Options.KafkaProperties,
                 "LibRDKafka options, e.g. -X queued.min.messages 1000");

  std::string LogLevelInfoStr =
      R"*(Set log message level. Set to 0 - 5 or one of
  `Trace`, `Debug`, `Info`, `Warning`, `Error`
  or `Critical`. Ex: "-v Debug". Default: `Warning`)*";
  App.add_option(
         "-v,--verbosity",
         [&Options, LogLevelInfoStr](std::vector<std::string> Input) {
           return parseLogLevel(Input, Options.LoggingLevel);
         },
         LogLevelInfoStr)
      ->default_str("Warning");
  App.add_option("--log-file", Options.LogFile, "Also write logs to this file");

  auto *Consume = App.add_subcommand("consume", "Print messages to stdout");
  Consume->add_option("-t,--topic", Options.Topic, "Topic to consume from")
      ->required();
  addConsumerOptions(*Consume, Options);
  addFormatOptions(*Consume, Options);

  auto *Produce = App.add_subcommand(
      "produce", "Publish one message per line read from stdin");
  Produce->add_option("-t,--topic", Options.Topic, "Topic to publish to")
      ->required();
  addFormatOptions(*Produce, Options);

  auto *Copy =
      App.add_subcommand("copy", "Copy messages from one topic to another");
  Copy->add_option("--from-topic", Options.FromTopic, "Source topic")
      ->required();
  Copy->add_option("--to-topic", Options.ToTopic, "Destination topic")
      ->required();
  addConsumerOptions(*Copy, Options);

  auto *Watermarks = App.add_subcommand(
      "watermarks", "Print low and high watermark of a partition");
  Watermarks->add_option("-t,--topic", Options.Topic, "Topic to query")
      ->required();
  Watermarks->add_option("-p,--partition", Options.Partition,
                         "Partition to query");

  auto *CreateTopic = App.add_subcommand("create-topic", "Create a topic");
  CreateTopic->add_option("-t,--topic", Options.Topic, "Topic to create")
      ->required();
  CreateTopic->add_option("--partitions", Options.Partitions,
                          "Number of partitions")
      ->check(CLI::PositiveNumber);
}

Kafcat::AuthConfig toAuthConfig(KafcatOptions const &Options) {
  Kafcat::AuthConfig Auth;
  for (auto const &Entry : Options.Brokers) {
    for (auto const &Broker : splitString(Entry, ',')) {
      Auth.Brokers.push_back(Broker);
    }
  }
  Auth.Protocol = Kafcat::parseSecurityProtocol(Options.SecurityProtocol);
  auto const &Tls = Options.Tls;
  if (Auth.Protocol == Kafcat::SecurityProtocol::Ssl ||
      Auth.Protocol == Kafcat::SecurityProtocol::SaslSsl || !Tls.CaFile.empty() ||
      !Tls.ClientCertFile.empty() || !Tls.ClientKeyFile.empty()) {
    Auth.Tls = Tls;
  }
  Auth.KafkaProperties = Options.KafkaProperties;
  return Auth;
}

Kafcat::ConsumerConfig toConsumerConfig(KafcatOptions const &Options,
                                        std::string const &Topic) {
  Kafcat::ConsumerConfig Config;
  Config.GroupId = Options.GroupId;
  Config.Topic = Topic;
  Config.Partition = Options.Partition;
  Config.ExitOnDone = Options.ExitOnDone;
  Config.Auth = toAuthConfig(Options);
  return Config;
}

Kafcat::ProducerConfig toProducerConfig(KafcatOptions const &Options,
                                        std::string const &Topic) {
  return {Topic, toAuthConfig(Options)};
}
