// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "SetThreadName.h"
#include <pthread.h>

void setThreadName(std::string const &NewName) {
  // Linux rejects names longer than 15 characters (plus terminator).
  auto const UsedName = NewName.substr(0, 15);
#ifdef __APPLE__
  pthread_setname_np(UsedName.c_str());
#elif __linux__
  pthread_setname_np(pthread_self(), UsedName.c_str());
#else
#pragma message("Unsupported platform. Unable to set thread name.")
#endif
}
