// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Admin.h"
#include "CLIOptions.h"
#include "Consumer.h"
#include "Errors.h"
#include "Kafka/RdKafkaClientFactory.h"
#include "MessageFormat.h"
#include "Producer.h"
#include "logger.h"
#include <CLI/CLI.hpp>
#include <iostream>

namespace {

void consume(KafcatOptions const &Options,
             Kafka::ClientFactoryInterface &Factory) {
  auto Format = Kafcat::parseMessageFormat(Options.Format);
  auto Consumer = Kafcat::Consumer::fromConfig(
      toConsumerConfig(Options, Options.Topic), Factory);
  Consumer->setOffsetAndSubscribe(Kafcat::parseKafkaOffset(Options.Offset));
  Consumer->forEach([&](Kafcat::Message const &Msg) {
    std::cout << Kafcat::formatMessage(Msg, Format, Options.KeyDelimiter)
              << std::endl;
  });
}

void produce(KafcatOptions const &Options,
             Kafka::ClientFactoryInterface &Factory) {
  auto Format = Kafcat::parseMessageFormat(Options.Format);
  auto Producer = Kafcat::Producer::fromConfig(
      toProducerConfig(Options, Options.Topic), Factory);
  std::string Line;
  std::size_t Count{0};
  while (std::getline(std::cin, Line)) {
    Producer->writeOne(
        Kafcat::parseMessageLine(Line, Format, Options.KeyDelimiter));
    ++Count;
  }
  Logger::Info(R"(Published {} message(s) to "{}".)", Count, Options.Topic);
}

void copy(KafcatOptions const &Options,
          Kafka::ClientFactoryInterface &Factory) {
  auto Consumer = Kafcat::Consumer::fromConfig(
      toConsumerConfig(Options, Options.FromTopic), Factory);
  auto Producer = Kafcat::Producer::fromConfig(
      toProducerConfig(Options, Options.ToTopic), Factory);
  Consumer->setOffsetAndSubscribe(Kafcat::parseKafkaOffset(Options.Offset));
  std::size_t Count{0};
  Consumer->forEach([&](Kafcat::Message const &Msg) {
    Producer->writeOne(Msg);
    ++Count;
  });
  Logger::Info(R"(Copied {} message(s) from "{}" to "{}".)", Count,
               Options.FromTopic, Options.ToTopic);
}

void printWatermarks(KafcatOptions const &Options,
                     Kafka::ClientFactoryInterface &Factory) {
  auto Consumer = Kafcat::Consumer::fromConfig(
      toConsumerConfig(Options, Options.Topic), Factory);
  auto [Low, High] = Consumer->getWatermarks();
  std::cout << Low << " " << High << std::endl;
}

void createTopic(KafcatOptions const &Options,
                 Kafka::ClientFactoryInterface &Factory) {
  auto Admin = Kafcat::Admin::fromConfig(toAuthConfig(Options), Factory);
  Admin->createTopic(Options.Topic, Options.Partitions);
}

} // namespace

int main(int argc, char **argv) {
  CLI::App App{"kafcat - read, write and copy Kafka messages"};
  auto Options = std::make_unique<KafcatOptions>();
  setCLIOptions(App, *Options);
  CLI11_PARSE(App, argc, argv);
  setUpLogging(Options->LoggingLevel, Options->LogFile);

  Kafka::RdKafkaClientFactory Factory;
  try {
    if (App.got_subcommand("consume")) {
      consume(*Options, Factory);
    } else if (App.got_subcommand("produce")) {
      produce(*Options, Factory);
    } else if (App.got_subcommand("copy")) {
      copy(*Options, Factory);
    } else if (App.got_subcommand("watermarks")) {
      printWatermarks(*Options, Factory);
    } else if (App.got_subcommand("create-topic")) {
      createTopic(*Options, Factory);
    }
  } catch (Kafcat::KafcatError const &Error) {
    Logger::Critical("{}", Error.what());
    return EXIT_FAILURE;
  } catch (std::exception const &Error) {
    Logger::Critical("Unexpected error: {}", Error.what());
    return EXIT_FAILURE;
  }
  spdlog::shutdown();
  return EXIT_SUCCESS;
}
