// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include "Kafka/ClientInterfaces.h"
#include <memory>
#include <mutex>

namespace Kafcat {

/// The consumer connection and the mutex serializing access to it.
struct Connection {
  explicit Connection(std::unique_ptr<Kafka::ConsumerHandle> Handle)
      : Handle(std::move(Handle)) {}
  std::mutex Mutex;
  std::unique_ptr<Kafka::ConsumerHandle> Handle;
};

/// \brief Exclusive access to a Connection for as long as the lease lives.
class ConnectionLease {
public:
  /// Blocks until the connection is free.
  explicit ConnectionLease(std::shared_ptr<Connection> Conn)
      : Conn(std::move(Conn)), Lock(this->Conn->Mutex) {}

  ConnectionLease(ConnectionLease &&) = default;
  ConnectionLease &operator=(ConnectionLease &&) = delete;

  Kafka::ConsumerHandle &handle() { return *Conn->Handle; }

  void release() {
    if (Lock.owns_lock()) {
      Lock.unlock();
    }
  }

private:
  std::shared_ptr<Connection> Conn;
  std::unique_lock<std::mutex> Lock;
};

} // namespace Kafcat
