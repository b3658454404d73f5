// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "TimeUtility.h"
#include <date/date.h>

std::string toUTCDateTime(time_point TimeStamp) {
  return date::format("%Y-%m-%dT%H:%M:%SZ",
                      date::floor<std::chrono::milliseconds>(TimeStamp));
}
