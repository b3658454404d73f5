// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "Message.h"
#include <string>

namespace Kafcat {

/// How messages are written to and read from lines of text.
///
/// Text is `payload`, or `key<delimiter>payload` when a key delimiter is
/// given. Json is one object per line with the fields key, payload,
/// timestamp and headers.
enum class MessageFormat { Text, Json };

/// \throws ConfigurationError for unknown format names.
MessageFormat parseMessageFormat(std::string const &Name);

std::string formatMessage(Message const &Msg, MessageFormat Format,
                          std::string const &KeyDelimiter = "");

/// \throws KafcatError if the line is not valid in the given format.
Message parseMessageLine(std::string const &Line, MessageFormat Format,
                         std::string const &KeyDelimiter = "");

} // namespace Kafcat
