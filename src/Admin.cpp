// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Admin.h"
#include "ClientConfigBuilder.h"
#include "logger.h"

namespace Kafcat {

std::unique_ptr<Admin> Admin::fromConfig(AuthConfig const &Auth,
                                         Kafka::ClientFactoryInterface &Factory) {
  auto Settings = buildAdminSettings(Auth);
  auto Handle = Factory.createAdmin(Settings);
  return std::make_unique<Admin>(std::move(Settings), std::move(Handle));
}

Admin::Admin(Kafka::BrokerSettings Settings,
             std::unique_ptr<Kafka::AdminHandle> Handle)
    : Settings(std::move(Settings)), Handle(std::move(Handle)) {}

void Admin::createTopic(std::string const &Name, int Partitions) {
  Logger::Debug(R"(Creating topic "{}" with {} partition(s).)", Name,
                Partitions);
  Handle->createTopic(Name, Partitions, 1, Settings.AdminOperationTimeout);
}

} // namespace Kafcat
