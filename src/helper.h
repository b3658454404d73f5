// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#pragma once

#include <string>
#include <vector>

// \brief Get the current process ID.
// \return Process ID.
int getPID();

// \brief Get the hostname.
// \return The hostname.
std::string getHostName();

/// \brief Join strings with a separator, e.g. a list of brokers.
std::string joinStrings(std::vector<std::string> const &Parts,
                        std::string const &Separator);

/// \brief Split a string on every occurrence of a separator character.
///
/// Empty parts are dropped.
std::vector<std::string> splitString(std::string const &Input,
                                     char Separator);
