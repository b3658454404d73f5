// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "helper.h"
#include <numeric>
#include <sstream>
#include <unistd.h>

int getPID() { return getpid(); }

// Wrapper, because it may need some Windows implementation in the future.
std::string getHostName() {
  std::vector<char> Buffer;
  Buffer.resize(1024);
  int Result = gethostname(Buffer.data(), Buffer.size());
  Buffer.back() = '\0';
  if (Result != 0) {
    return "";
  }
  return Buffer.data();
}

std::string joinStrings(std::vector<std::string> const &Parts,
                        std::string const &Separator) {
  if (Parts.empty()) {
    return "";
  }
  return std::accumulate(std::next(Parts.begin()), Parts.end(), Parts.at(0),
                         [&Separator](std::string const &a,
                                      std::string const &b) {
                           return a + Separator + b;
                         });
}

std::vector<std::string> splitString(std::string const &Input,
                                     char Separator) {
  std::vector<std::string> Parts;
  std::istringstream Stream(Input);
  std::string Part;
  while (std::getline(Stream, Part, Separator)) {
    if (!Part.empty()) {
      Parts.push_back(Part);
    }
  }
  return Parts;
}
