// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "MessageFormat.h"
#include "Errors.h"
#include "json.h"
#include <fmt/format.h>

namespace Kafcat {

MessageFormat parseMessageFormat(std::string const &Name) {
  if (Name == "text") {
    return MessageFormat::Text;
  }
  if (Name == "json") {
    return MessageFormat::Json;
  }
  throw ConfigurationError(fmt::format(
      R"(Unknown message format "{}", expected "text" or "json".)", Name));
}

namespace {
std::string formatJson(Message const &Msg) {
  nlohmann::json Headers = nlohmann::json::object();
  for (auto const &[Key, Value] : Msg.getHeaders()) {
    Headers[Key] = toString(Value);
  }
  nlohmann::json Json{{"key", toString(Msg.getKey())},
                      {"payload", toString(Msg.getPayload())},
                      {"timestamp", Msg.getTimestamp()},
                      {"headers", Headers}};
  // Message data need not be valid UTF-8.
  return Json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Message parseJson(std::string const &Line) {
  try {
    auto Json = nlohmann::json::parse(Line);
    if (!Json.is_object()) {
      throw KafcatError(
          fmt::format(R"(Expected a JSON object but got "{}".)", Line));
    }
    Message Msg;
    Msg.setKey(toBytes(findValue<std::string>("key", Json).value_or("")));
    Msg.setPayload(
        toBytes(findValue<std::string>("payload", Json).value_or("")));
    Msg.setTimestamp(findValue<std::int64_t>("timestamp", Json).value_or(0));
    if (auto HeadersJson = findValue<nlohmann::json>("headers", Json)) {
      Headers MessageHeaders;
      for (auto const &[Key, Value] : HeadersJson->items()) {
        MessageHeaders[Key] = toBytes(Value.get<std::string>());
      }
      Msg.setHeaders(std::move(MessageHeaders));
    }
    return Msg;
  } catch (nlohmann::json::exception const &Error) {
    throw KafcatError(fmt::format(R"(Unable to parse message "{}": {})", Line,
                                  Error.what()));
  }
}
} // namespace

std::string formatMessage(Message const &Msg, MessageFormat Format,
                          std::string const &KeyDelimiter) {
  if (Format == MessageFormat::Json) {
    return formatJson(Msg);
  }
  if (KeyDelimiter.empty()) {
    return toString(Msg.getPayload());
  }
  return toString(Msg.getKey()) + KeyDelimiter + toString(Msg.getPayload());
}

Message parseMessageLine(std::string const &Line, MessageFormat Format,
                         std::string const &KeyDelimiter) {
  if (Format == MessageFormat::Json) {
    return parseJson(Line);
  }
  Message Msg;
  auto Split =
      KeyDelimiter.empty() ? std::string::npos : Line.find(KeyDelimiter);
  if (Split == std::string::npos) {
    Msg.setPayload(toBytes(Line));
  } else {
    Msg.setKey(toBytes(Line.substr(0, Split)));
    Msg.setPayload(toBytes(Line.substr(Split + KeyDelimiter.size())));
  }
  return Msg;
}

} // namespace Kafcat
