// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Kafcat {

/// Value of \p Key in \p Json, if present and not null.
template <typename T>
std::optional<T> findValue(std::string const &Key, nlohmann::json const &Json) {
  auto It = Json.find(Key);
  if (It != Json.end() && !It->is_null()) {
    return std::optional<T>(It.value().get<T>());
  }
  return std::nullopt;
}

} // namespace Kafcat
