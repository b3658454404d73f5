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
#include "Kafka/BrokerSettings.h"
#include "Kafka/ClientInterfaces.h"
#include <memory>

namespace Kafcat {

/// Topic administration.
class Admin {
public:
  /// \throws ConfigurationError before any connection is attempted.
  /// \throws ConnectionError if the client can not be created.
  static std::unique_ptr<Admin> fromConfig(AuthConfig const &Auth,
                                           Kafka::ClientFactoryInterface &Factory);

  Admin(Kafka::BrokerSettings Settings,
        std::unique_ptr<Kafka::AdminHandle> Handle);

  /// Create a topic with replication factor 1.
  /// \throws BrokerRoundTripError if the broker refuses or does not answer.
  void createTopic(std::string const &Name, int Partitions);

private:
  Kafka::BrokerSettings const Settings;
  std::unique_ptr<Kafka::AdminHandle> Handle;
};

} // namespace Kafcat
