// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "json.h"
#include <gtest/gtest.h>

using nlohmann::json;
using Kafcat::findValue;

TEST(json, findValueOfPresentKey) {
  auto Doc = json::parse(R"""({"key": "k", "timestamp": 42})""");
  EXPECT_EQ(findValue<std::string>("key", Doc), "k");
  EXPECT_EQ(findValue<std::int64_t>("timestamp", Doc), 42);
}

TEST(json, findValueOfMissingKeyIsEmpty) {
  auto Doc = json::parse(R"""({"key": "k"})""");
  EXPECT_FALSE(findValue<std::string>("payload", Doc).has_value());
}

TEST(json, findValueOfNullIsEmpty) {
  auto Doc = json::parse(R"""({"key": null})""");
  EXPECT_FALSE(findValue<std::string>("key", Doc).has_value());
}

TEST(json, findValueOfWrongTypeThrows) {
  auto Doc = json::parse(R"""({"timestamp": "yesterday"})""");
  EXPECT_THROW(findValue<std::int64_t>("timestamp", Doc), json::type_error);
}
