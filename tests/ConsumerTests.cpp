// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Consumer.h"
#include "Errors.h"
#include "helpers/MockClientHandles.h"
#include "helpers/StubConsumerHandle.h"
#include <future>
#include <gtest/gtest.h>

using namespace Kafcat;
using trompeloeil::_;

namespace {
Message makeMessage(std::string const &Key, std::string const &Payload,
                    std::int64_t Timestamp = 1) {
  return {toBytes(Key), toBytes(Payload), Timestamp};
}
} // namespace

class ConsumerTest : public ::testing::Test {
protected:
  void SetUp() override {
    Config.Topic = "topic";
    Config.Partition = 2;
    Config.Auth.Brokers = {"localhost:9092"};
    Clock = std::make_shared<FakeClock>();
  }

  std::unique_ptr<Consumer>
  makeConsumer(std::unique_ptr<Kafka::ConsumerHandle> Handle) {
    return std::make_unique<Consumer>(Config, Settings, std::move(Handle),
                                      Clock);
  }

  ConsumerConfig Config;
  Kafka::BrokerSettings Settings;
  std::shared_ptr<FakeClock> Clock;
};

TEST_F(ConsumerTest, SubscribeAssignsConfiguredPartition) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  REQUIRE_CALL(Mock, assign("topic", 2, ConcreteOffset::Beginning));
  UnderTest->setOffsetAndSubscribe(OffsetBeginning{});
}

TEST_F(ConsumerTest, MissingPartitionDefaultsToZero) {
  Config.Partition.reset();
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  REQUIRE_CALL(Mock, assign("topic", 0, ConcreteOffset::fromTail(1)));
  UnderTest->setOffsetAndSubscribe(OffsetValue{-2});
}

TEST_F(ConsumerTest, SecondSubscribeReplacesAssignment) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  trompeloeil::sequence Sequence;
  REQUIRE_CALL(Mock, assign("topic", 2, 10)).IN_SEQUENCE(Sequence);
  REQUIRE_CALL(Mock, assign("topic", 2, ConcreteOffset::End))
      .IN_SEQUENCE(Sequence);
  UnderTest->setOffsetAndSubscribe(OffsetValue{10});
  UnderTest->setOffsetAndSubscribe(OffsetEnd{});
}

TEST_F(ConsumerTest, TimeOffsetIsResolvedBeforeAssignment) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  OffsetList Response{{"topic", 2, 17, ""}};
  trompeloeil::sequence Sequence;
  REQUIRE_CALL(Mock, offsetsForTimes("topic", 2, 5000, _))
      .IN_SEQUENCE(Sequence)
      .RETURN(Response);
  REQUIRE_CALL(Mock, assign("topic", 2, 17)).IN_SEQUENCE(Sequence);
  UnderTest->setOffsetAndSubscribe(TimeInterval{5000, UnboundedEnd});
}

TEST_F(ConsumerTest, FailedTimeLookupLeavesAssignmentUnchanged) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  REQUIRE_CALL(Mock, offsetsForTimes("topic", 2, 5000, _))
      .THROW(BrokerRoundTripError("Local: Timed out"));
  FORBID_CALL(Mock, assign(_, _, _));
  EXPECT_THROW(UnderTest->setOffsetAndSubscribe(TimeInterval{5000, 6000}),
               BrokerRoundTripError);
}

TEST_F(ConsumerTest, ReceiveOneSkipsTimeouts) {
  auto Handle = std::make_unique<StubConsumerHandle>();
  auto *Stub = Handle.get();
  Stub->addResult({Kafka::PollStatus::TimedOut, {}, ""});
  Stub->addResult({Kafka::PollStatus::EndOfPartition, {}, ""});
  Stub->addMessage(makeMessage("key", "payload", 1234));
  auto UnderTest = makeConsumer(std::move(Handle));
  EXPECT_EQ(UnderTest->receiveOne(), makeMessage("key", "payload", 1234));
  EXPECT_EQ(Stub->getPollCount(), 3);
}

TEST_F(ConsumerTest, ReceiveOneThrowsOnPollError) {
  auto Handle = std::make_unique<StubConsumerHandle>();
  Handle->addResult(
      {Kafka::PollStatus::Error, {}, "Broker: Leader not available"});
  auto UnderTest = makeConsumer(std::move(Handle));
  EXPECT_THROW(UnderTest->receiveOne(), BrokerRoundTripError);
}

TEST_F(ConsumerTest, WatermarksOfConfiguredPartition) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  REQUIRE_CALL(Mock, queryWatermarkOffsets("topic", 2, _))
      .RETURN(Watermarks(3, 11));
  EXPECT_EQ(UnderTest->getWatermarks(), Watermarks(3, 11));
}

TEST_F(ConsumerTest, WatermarkFailureIsPassedOn) {
  auto Handle = std::make_unique<MockConsumerHandle>();
  auto &Mock = *Handle;
  auto UnderTest = makeConsumer(std::move(Handle));
  REQUIRE_CALL(Mock, queryWatermarkOffsets("topic", 2, _))
      .THROW(BrokerRoundTripError("Broker: Unknown topic or partition"));
  EXPECT_THROW(UnderTest->getWatermarks(), BrokerRoundTripError);
}

TEST_F(ConsumerTest, IdleLimitDependsOnExitOnDone) {
  auto UnderTest = makeConsumer(std::make_unique<StubConsumerHandle>());
  EXPECT_EQ(UnderTest->idleLimit(), duration(std::chrono::hours(1)));
  Config.ExitOnDone = true;
  auto Exiting = makeConsumer(std::make_unique<StubConsumerHandle>());
  EXPECT_EQ(Exiting->idleLimit(), duration(3s));
}

TEST_F(ConsumerTest, StreamEndsAfterIdleLimit) {
  Config.ExitOnDone = true;
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  Handle->addMessage(makeMessage("a", "1"));
  Handle->addMessage(makeMessage("b", "2"));
  auto UnderTest = makeConsumer(std::move(Handle));
  auto Stream = UnderTest->stream();
  ASSERT_EQ(Stream.next(), makeMessage("a", "1"));
  ASSERT_EQ(Stream.next(), makeMessage("b", "2"));
  EXPECT_EQ(Stream.next(), std::nullopt);
  EXPECT_EQ(Stream.terminationReason(),
            MessageStream::TerminationReason::IdleTimeout);
  EXPECT_EQ(Stream.next(), std::nullopt);
}

TEST_F(ConsumerTest, StreamWithoutExitOnDoneOutlastsQuietPeriod) {
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  // 150 polls of 100 ms each, 15 s without traffic.
  Handle->addTimeouts(150);
  Handle->addMessage(makeMessage("late", "1"));
  auto *Stub = Handle.get();
  auto UnderTest = makeConsumer(std::move(Handle));
  auto Start = Clock->get_current_time();
  auto Stream = UnderTest->stream();
  ASSERT_EQ(Stream.next(), makeMessage("late", "1"));
  EXPECT_GE(Clock->get_current_time() - Start, duration(10s));
  EXPECT_EQ(Stub->getPollCount(), 151);
  EXPECT_EQ(Stream.terminationReason(),
            MessageStream::TerminationReason::Running);
}

TEST_F(ConsumerTest, StreamEndsWithErrorOnPollError) {
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  Handle->addMessage(makeMessage("a", "1"));
  Handle->addResult(
      {Kafka::PollStatus::Error, {}, "Local: Broker transport failure"});
  auto UnderTest = makeConsumer(std::move(Handle));
  auto Stream = UnderTest->stream();
  ASSERT_EQ(Stream.next(), makeMessage("a", "1"));
  EXPECT_THROW(Stream.next(), BrokerRoundTripError);
  EXPECT_EQ(Stream.terminationReason(),
            MessageStream::TerminationReason::Error);
  EXPECT_EQ(Stream.next(), std::nullopt);
}

TEST_F(ConsumerTest, StreamHoldsConnectionUntilClosed) {
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  Handle->Low = 1;
  Handle->High = 5;
  auto UnderTest = makeConsumer(std::move(Handle));
  auto Stream = UnderTest->stream();
  auto Pending = std::async(std::launch::async,
                            [&]() { return UnderTest->getWatermarks(); });
  EXPECT_EQ(Pending.wait_for(200ms), std::future_status::timeout);
  Stream.close();
  EXPECT_EQ(Stream.terminationReason(),
            MessageStream::TerminationReason::Closed);
  EXPECT_EQ(Pending.get(), Watermarks(1, 5));
}

TEST_F(ConsumerTest, EndedStreamReleasesConnection) {
  Config.ExitOnDone = true;
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  auto *Stub = Handle.get();
  auto UnderTest = makeConsumer(std::move(Handle));
  {
    auto Stream = UnderTest->stream();
    EXPECT_EQ(Stream.next(), std::nullopt);
  }
  UnderTest->setOffsetAndSubscribe(OffsetValue{4});
  ASSERT_EQ(Stub->getAssignments().size(), 1u);
  EXPECT_EQ(Stub->getAssignments().front().Offset, 4);
}

TEST_F(ConsumerTest, ForEachVisitsMessagesInOrder) {
  Config.ExitOnDone = true;
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  Handle->addMessage(makeMessage("a", "1"));
  Handle->addResult({Kafka::PollStatus::TimedOut, {}, ""});
  Handle->addMessage(makeMessage("b", "2"));
  auto UnderTest = makeConsumer(std::move(Handle));
  std::vector<Message> Received;
  UnderTest->forEach(
      [&Received](Message const &Msg) { Received.push_back(Msg); });
  ASSERT_EQ(Received.size(), 2u);
  EXPECT_EQ(Received[0], makeMessage("a", "1"));
  EXPECT_EQ(Received[1], makeMessage("b", "2"));
}

TEST_F(ConsumerTest, ForEachPassesOnHandlerError) {
  Config.ExitOnDone = true;
  auto Handle = std::make_unique<StubConsumerHandle>(Clock);
  Handle->addMessage(makeMessage("a", "1"));
  Handle->addMessage(makeMessage("b", "2"));
  auto UnderTest = makeConsumer(std::move(Handle));
  int Calls{0};
  EXPECT_THROW(UnderTest->forEach([&Calls](Message const &) {
    ++Calls;
    throw std::runtime_error("handler failed");
  }),
               std::runtime_error);
  EXPECT_EQ(Calls, 1);
  // The connection is free again.
  UnderTest->setOffsetAndSubscribe(OffsetEnd{});
}

TEST_F(ConsumerTest, FromConfigRejectsInvalidConfigBeforeConnecting) {
  Config.Auth.Protocol = SecurityProtocol::Ssl;
  MockClientFactory Factory;
  FORBID_CALL(Factory, createConsumer(_));
  EXPECT_THROW(Consumer::fromConfig(Config, Factory), ConfigurationError);
}

TEST_F(ConsumerTest, FromConfigPassesConnectionErrorOn) {
  MockClientFactory Factory;
  REQUIRE_CALL(Factory, createConsumer(_))
      .THROW(ConnectionError("Failed to create consumer"));
  EXPECT_THROW(Consumer::fromConfig(Config, Factory), ConnectionError);
}
