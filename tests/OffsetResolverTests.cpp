// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Errors.h"
#include "OffsetResolver.h"
#include "helpers/MockClientHandles.h"
#include <gtest/gtest.h>

using namespace Kafcat;
using trompeloeil::_;

class OffsetResolverTest : public ::testing::Test {
protected:
  std::int64_t resolve(KafkaOffset const &Offset) {
    return resolveOffset(Offset, "topic", 0, Handle, Executor);
  }
  MockConsumerHandle Handle;
  ThreadedExecutor Executor{"resolver_test"};
};

TEST_F(OffsetResolverTest, NamedPositionsNeedNoRoundTrip) {
  EXPECT_EQ(resolve(OffsetBeginning{}), ConcreteOffset::Beginning);
  EXPECT_EQ(resolve(OffsetEnd{}), ConcreteOffset::End);
  EXPECT_EQ(resolve(OffsetStored{}), ConcreteOffset::Stored);
}

TEST_F(OffsetResolverTest, PositiveValueIsAbsolute) {
  EXPECT_EQ(resolve(OffsetValue{5}), 5);
  EXPECT_EQ(resolve(OffsetValue{0}), 0);
}

TEST_F(OffsetResolverTest, NegativeValueCountsFromTail) {
  EXPECT_EQ(resolve(OffsetValue{-1}), ConcreteOffset::fromTail(0));
  EXPECT_EQ(resolve(OffsetValue{-3}), ConcreteOffset::fromTail(2));
}

TEST_F(OffsetResolverTest, DeepestTailCountStaysFromTail) {
  auto Resolved = resolve(OffsetValue{ConcreteOffset::MinTailValue});
  EXPECT_TRUE(ConcreteOffset::isFromTail(Resolved));
  EXPECT_EQ(ConcreteOffset::tailCount(Resolved), ConcreteOffset::MaxTailCount);
}

TEST_F(OffsetResolverTest, TailCountBeyondEncodingThrows) {
  FORBID_CALL(Handle, offsetsForTimes(_, _, _, _));
  EXPECT_THROW(resolve(OffsetValue{std::numeric_limits<std::int64_t>::min()}),
               ConfigurationError);
  EXPECT_THROW(resolve(OffsetValue{ConcreteOffset::MinTailValue - 1}),
               ConfigurationError);
}

TEST_F(OffsetResolverTest, NegativeIntervalBeginThrows) {
  EXPECT_THROW(resolve(OffsetInterval{-1, UnboundedEnd}), ConfigurationError);
  EXPECT_THROW(resolve(OffsetInterval{-2, 5}), ConfigurationError);
}

TEST_F(OffsetResolverTest, OffsetIntervalStartsAtBegin) {
  EXPECT_EQ(resolve(OffsetInterval{7, 9}), 7);
  EXPECT_EQ(resolve(OffsetInterval{7, UnboundedEnd}), 7);
}

TEST_F(OffsetResolverTest, TimeIntervalIsLookedUp) {
  OffsetList Response{{"topic", 0, 42, ""}};
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000, _))
      .RETURN(Response);
  EXPECT_EQ(resolve(TimeInterval{1000, UnboundedEnd}), 42);
}

TEST_F(OffsetResolverTest, TimeAfterLastMessageResolvesToEnd) {
  OffsetList Response{{"topic", 0, -1, ""}};
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000, _))
      .RETURN(Response);
  EXPECT_EQ(resolve(TimeInterval{1000, 2000}), ConcreteOffset::End);
}

TEST_F(OffsetResolverTest, LookupUsesGivenTimeout) {
  OffsetList Response{{"topic", 0, 3, ""}};
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000,
                                       Kafka::duration(std::chrono::seconds(4))))
      .RETURN(Response);
  EXPECT_EQ(resolveOffset(TimeInterval{1000, UnboundedEnd}, "topic", 0, Handle,
                          Executor, std::chrono::seconds(4)),
            3);
}

TEST_F(OffsetResolverTest, FailedLookupThrows) {
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000, _))
      .THROW(BrokerRoundTripError("Local: Timed out"));
  EXPECT_THROW(resolve(TimeInterval{1000, UnboundedEnd}),
               BrokerRoundTripError);
}

TEST_F(OffsetResolverTest, PartitionErrorThrows) {
  OffsetList Response{{"topic", 0, -1, "Broker: Unknown topic or partition"}};
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000, _))
      .RETURN(Response);
  EXPECT_THROW(resolve(TimeInterval{1000, UnboundedEnd}),
               BrokerRoundTripError);
}

TEST_F(OffsetResolverTest, MissingPartitionInResponseIsInvariantViolation) {
  OffsetList Response{{"topic", 1, 42, ""}};
  REQUIRE_CALL(Handle, offsetsForTimes("topic", 0, 1000, _))
      .RETURN(Response);
  EXPECT_THROW(resolve(TimeInterval{1000, UnboundedEnd}), InvariantViolation);
}
