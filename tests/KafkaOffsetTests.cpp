// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Errors.h"
#include "KafkaOffset.h"
#include <gtest/gtest.h>

using namespace Kafcat;

TEST(KafkaOffset, NamedPositionsAreCaseInsensitive) {
  EXPECT_EQ(parseKafkaOffset("beginning"), KafkaOffset{OffsetBeginning{}});
  EXPECT_EQ(parseKafkaOffset("END"), KafkaOffset{OffsetEnd{}});
  EXPECT_EQ(parseKafkaOffset("Stored"), KafkaOffset{OffsetStored{}});
}

TEST(KafkaOffset, RawValues) {
  EXPECT_EQ(parseKafkaOffset("42"), KafkaOffset{OffsetValue{42}});
  EXPECT_EQ(parseKafkaOffset("0"), KafkaOffset{OffsetValue{0}});
  EXPECT_EQ(parseKafkaOffset("-1"), KafkaOffset{OffsetValue{-1}});
}

TEST(KafkaOffset, OffsetIntervals) {
  EXPECT_EQ(parseKafkaOffset("10..20"), KafkaOffset(OffsetInterval{10, 20}));
  EXPECT_EQ(parseKafkaOffset("10.."),
            KafkaOffset(OffsetInterval{10, UnboundedEnd}));
}

TEST(KafkaOffset, TimeIntervals) {
  EXPECT_EQ(parseKafkaOffset("s@1000"),
            KafkaOffset(TimeInterval{1000, UnboundedEnd}));
  EXPECT_EQ(parseKafkaOffset("s@1000..e@2000"),
            KafkaOffset(TimeInterval{1000, 2000}));
}

TEST(KafkaOffset, InvalidTextThrows) {
  EXPECT_THROW(parseKafkaOffset(""), ConfigurationError);
  EXPECT_THROW(parseKafkaOffset("latest"), ConfigurationError);
  EXPECT_THROW(parseKafkaOffset("20..10"), ConfigurationError);
  EXPECT_THROW(parseKafkaOffset("s@2000..e@1000"), ConfigurationError);
  EXPECT_THROW(parseKafkaOffset("99999999999999999999"), ConfigurationError);
}

TEST(KafkaOffset, TailCountBeyondEncodingThrows) {
  EXPECT_THROW(parseKafkaOffset("-9223372036854775808"), ConfigurationError);
  EXPECT_THROW(parseKafkaOffset("-9223372036854775000"), ConfigurationError);
  EXPECT_EQ(parseKafkaOffset(std::to_string(ConcreteOffset::MinTailValue)),
            KafkaOffset{OffsetValue{ConcreteOffset::MinTailValue}});
}

TEST(KafkaOffset, ToStringParsesBack) {
  for (auto const &Text :
       {"beginning", "end", "stored", "-3", "5..", "5..8", "s@10..e@20"}) {
    EXPECT_EQ(toString(parseKafkaOffset(Text)), Text);
  }
}

TEST(ConcreteOffset, TailEncoding) {
  EXPECT_EQ(ConcreteOffset::fromTail(0), -2000);
  EXPECT_EQ(ConcreteOffset::fromTail(3), -2003);
  EXPECT_TRUE(ConcreteOffset::isFromTail(ConcreteOffset::fromTail(0)));
  EXPECT_FALSE(ConcreteOffset::isFromTail(ConcreteOffset::Stored));
  EXPECT_EQ(ConcreteOffset::tailCount(ConcreteOffset::fromTail(7)), 7);
  EXPECT_EQ(ConcreteOffset::fromTail(ConcreteOffset::MaxTailCount),
            std::numeric_limits<std::int64_t>::min());
}
