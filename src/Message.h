// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Kafcat {

using Bytes = std::vector<unsigned char>;
using Headers = std::map<std::string, Bytes>;

Bytes toBytes(std::string const &Input);
std::string toString(Bytes const &Input);

/// \brief A Kafka record as seen by the business logic.
///
/// Records without a key or payload are represented with an empty key or
/// payload. The timestamp is in milliseconds since the epoch.
class Message {
public:
  Message() = default;
  Message(Bytes Key, Bytes Payload, std::int64_t Timestamp,
          Headers MessageHeaders = {});

  [[nodiscard]] Bytes const &getKey() const { return Key; }
  [[nodiscard]] Bytes const &getPayload() const { return Payload; }
  [[nodiscard]] std::int64_t getTimestamp() const { return Timestamp; }
  [[nodiscard]] Headers const &getHeaders() const { return MessageHeaders; }

  void setKey(Bytes NewKey) { Key = std::move(NewKey); }
  void setPayload(Bytes NewPayload) { Payload = std::move(NewPayload); }
  void setTimestamp(std::int64_t NewTimestamp) { Timestamp = NewTimestamp; }
  void setHeaders(Headers NewHeaders) { MessageHeaders = std::move(NewHeaders); }

  bool operator==(Message const &Other) const;
  bool operator!=(Message const &Other) const { return !(*this == Other); }

private:
  Bytes Key;
  Bytes Payload;
  std::int64_t Timestamp{0};
  Headers MessageHeaders;
};

} // namespace Kafcat
