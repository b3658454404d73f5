// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

/// \file This file defines the exceptions thrown across the client
/// abstraction boundary. Idle timeout expiry of a message stream is not an
/// error and has no exception type.

#pragma once

#include <stdexcept>
#include <string>

namespace Kafcat {

/// Base of all recoverable errors raised by this library.
class KafcatError : public std::runtime_error {
public:
  explicit KafcatError(std::string const &Message)
      : std::runtime_error(Message) {}
};

/// \brief Invalid or unsupported configuration.
///
/// Always raised before any connection to a broker is attempted.
class ConfigurationError : public KafcatError {
public:
  explicit ConfigurationError(std::string const &Message)
      : KafcatError(Message) {}
};

/// A configuration value that is recognised but deliberately unsupported.
class NotImplementedError : public ConfigurationError {
public:
  explicit NotImplementedError(std::string const &Message)
      : ConfigurationError(Message) {}
};

/// The client engine was unable to create a connection handle.
class ConnectionError : public KafcatError {
public:
  explicit ConnectionError(std::string const &Message)
      : KafcatError(Message) {}
};

/// \brief A request to the broker failed.
///
/// Covers timeouts, unknown topics or partitions, poll errors and failed
/// deliveries. Never retried internally.
class BrokerRoundTripError : public KafcatError {
public:
  explicit BrokerRoundTripError(std::string const &Message)
      : KafcatError(Message) {}
};

/// The engine returned data that contradicts the request that was made.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(std::string const &Message)
      : std::logic_error(Message) {}
};

} // namespace Kafcat
