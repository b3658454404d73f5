// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "ClientInterfaces.h"
#include "Message.h"

namespace Kafka {
/// This class is used for storing messages for sending via librdkafka.
///
/// The producer takes a pointer to the instance and returns it via the
/// callback. It is then manually destructed/deallocated in the callback.
struct ProducerMessage {
  // Virtual to allow overriding in tests.
  virtual ~ProducerMessage() = default;
  std::optional<Kafcat::Bytes> Key;
  std::optional<Kafcat::Bytes> Payload;
  DeliveryCallback OnDelivery;

  [[nodiscard]] void *payloadData() {
    return Payload ? static_cast<void *>(Payload->data()) : nullptr;
  }
  [[nodiscard]] std::size_t payloadSize() const {
    return Payload ? Payload->size() : 0;
  }
  [[nodiscard]] void const *keyData() const {
    return Key ? static_cast<void const *>(Key->data()) : nullptr;
  }
  [[nodiscard]] std::size_t keySize() const { return Key ? Key->size() : 0; }
};
} // namespace Kafka
