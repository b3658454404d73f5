// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Message.h"

namespace Kafcat {

Bytes toBytes(std::string const &Input) {
  return Bytes(Input.begin(), Input.end());
}

std::string toString(Bytes const &Input) {
  return std::string(Input.begin(), Input.end());
}

Message::Message(Bytes Key, Bytes Payload, std::int64_t Timestamp,
                 Headers MessageHeaders)
    : Key(std::move(Key)), Payload(std::move(Payload)), Timestamp(Timestamp),
      MessageHeaders(std::move(MessageHeaders)) {}

bool Message::operator==(Message const &Other) const {
  return Key == Other.Key && Payload == Other.Payload &&
         Timestamp == Other.Timestamp && MessageHeaders == Other.MessageHeaders;
}

} // namespace Kafcat
