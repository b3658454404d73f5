// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "Kafka/ProducerDeliveryCb.h"
#include "helpers/MockMessage.h"
#include <gtest/gtest.h>

using namespace Kafka;

class ProducerDeliveryCbTest : public ::testing::Test {
protected:
  ProducerStats Stats;
  ProducerDeliveryCb UnderTest{Stats};
};

TEST_F(ProducerDeliveryCbTest, SuccessfulDeliveryIsReported) {
  std::optional<DeliveryResult> Reported;
  auto *Sent = new ProducerMessage;
  Sent->OnDelivery = [&Reported](DeliveryResult const &Result) {
    Reported = Result;
  };
  MockMessage Message;
  REQUIRE_CALL(Message, msg_opaque()).RETURN(Sent);
  ALLOW_CALL(Message, err()).RETURN(RdKafka::ErrorCode::ERR_NO_ERROR);
  UnderTest.dr_cb(Message);
  ASSERT_TRUE(Reported.has_value());
  EXPECT_TRUE(Reported->Delivered);
  EXPECT_EQ(Stats.produce_cb.load(), 1u);
  EXPECT_EQ(Stats.produce_cb_fail.load(), 0u);
}

TEST_F(ProducerDeliveryCbTest, FailedDeliveryCarriesErrorString) {
  std::optional<DeliveryResult> Reported;
  auto *Sent = new ProducerMessage;
  Sent->OnDelivery = [&Reported](DeliveryResult const &Result) {
    Reported = Result;
  };
  MockMessage Message;
  REQUIRE_CALL(Message, msg_opaque()).RETURN(Sent);
  ALLOW_CALL(Message, err())
      .RETURN(RdKafka::ErrorCode::ERR_MSG_SIZE_TOO_LARGE);
  ALLOW_CALL(Message, errstr()).RETURN("Broker: Message size too large");
  ALLOW_CALL(Message, topic_name()).RETURN("topic");
  UnderTest.dr_cb(Message);
  ASSERT_TRUE(Reported.has_value());
  EXPECT_FALSE(Reported->Delivered);
  EXPECT_EQ(Reported->Error, "Broker: Message size too large");
  EXPECT_EQ(Stats.produce_cb.load(), 0u);
  EXPECT_EQ(Stats.produce_cb_fail.load(), 1u);
}

struct ProducerMessageStandIn : ProducerMessage {
  explicit ProducerMessageStandIn(bool &Destroyed) : Destroyed(Destroyed) {}
  ~ProducerMessageStandIn() override { Destroyed = true; }
  bool &Destroyed;
};

TEST_F(ProducerDeliveryCbTest, MessageIsDeletedAfterReport) {
  bool Destroyed{false};
  ProducerMessage *Sent = new ProducerMessageStandIn(Destroyed);
  MockMessage Message;
  REQUIRE_CALL(Message, msg_opaque()).RETURN(Sent);
  ALLOW_CALL(Message, err()).RETURN(RdKafka::ErrorCode::ERR_NO_ERROR);
  UnderTest.dr_cb(Message);
  EXPECT_TRUE(Destroyed);
}

TEST_F(ProducerDeliveryCbTest, MissingOpaqueIsIgnored) {
  MockMessage Message;
  REQUIRE_CALL(Message, msg_opaque()).RETURN(nullptr);
  ALLOW_CALL(Message, err()).RETURN(RdKafka::ErrorCode::ERR_NO_ERROR);
  UnderTest.dr_cb(Message);
  EXPECT_EQ(Stats.produce_cb.load(), 1u);
}

TEST(ProducerMessage, KeyAndPayloadAccessors) {
  ProducerMessage Msg;
  EXPECT_EQ(Msg.keyData(), nullptr);
  EXPECT_EQ(Msg.payloadData(), nullptr);
  EXPECT_EQ(Msg.keySize(), 0u);
  Msg.Key = Kafcat::toBytes("key");
  Msg.Payload = Kafcat::toBytes("payload!");
  EXPECT_EQ(Msg.keySize(), 3u);
  EXPECT_EQ(Msg.payloadSize(), 8u);
  EXPECT_EQ(Msg.keyData(), static_cast<void const *>(Msg.Key->data()));
}
