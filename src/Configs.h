// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Kafcat {

enum class SecurityProtocol { Plaintext, SaslPlaintext, Ssl, SaslSsl };

std::string toString(SecurityProtocol Protocol);

/// Paths to the TLS material, loaded by the client engine.
struct TlsConfig {
  std::string CaFile;
  std::string ClientCertFile;
  std::string ClientKeyFile;
};

/// \brief Where and how to connect.
///
/// \p Tls is required for SecurityProtocol::Ssl. \p KafkaProperties are
/// passed on to the client engine as they are.
struct AuthConfig {
  std::vector<std::string> Brokers;
  SecurityProtocol Protocol{SecurityProtocol::Plaintext};
  std::optional<TlsConfig> Tls;
  std::map<std::string, std::string> KafkaProperties;
};

struct ConsumerConfig {
  /// Generated from host name and process id if left empty.
  std::string GroupId;
  std::string Topic;
  std::optional<int> Partition;
  /// Stop streaming after a short period without new messages.
  bool ExitOnDone{false};
  AuthConfig Auth;

  [[nodiscard]] int partition() const { return Partition.value_or(0); }
};

struct ProducerConfig {
  std::string Topic;
  AuthConfig Auth;
};

} // namespace Kafcat
