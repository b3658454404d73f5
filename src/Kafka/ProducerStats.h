// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <atomic>
#include <cstdint>

namespace Kafka {
struct ProducerStats {
  std::atomic<uint64_t> produced{0};
  std::atomic<uint64_t> produced_bytes{0};
  std::atomic<uint64_t> produce_fail{0};
  std::atomic<uint64_t> local_queue_full{0};
  std::atomic<uint64_t> msg_too_large{0};
  std::atomic<uint64_t> produce_cb{0};
  std::atomic<uint64_t> produce_cb_fail{0};
};
} // namespace Kafka
