// SPDX-License-Identifier: BSD-2-Clause
//
// This code has been produced by the European Spallation Source
// and its partner institutes under the BSD 2 Clause License.
//
// See LICENSE.md at the top level for license information.
//
// Screaming Udder!                              https://esss.se

#include "ClientConfigBuilder.h"
#include "Errors.h"
#include <gtest/gtest.h>

using namespace Kafcat;

class ClientConfigBuilderTest : public ::testing::Test {
protected:
  void SetUp() override { Auth.Brokers = {"host1:9092", "host2:9092"}; }
  AuthConfig Auth;
};

TEST_F(ClientConfigBuilderTest, PlaintextSetsBrokersAndProtocol) {
  auto Settings = buildBrokerSettings(Auth);
  EXPECT_EQ(Settings.Address, "host1:9092,host2:9092");
  EXPECT_EQ(Settings.KafkaConfiguration.at("security.protocol"), "plaintext");
  EXPECT_EQ(Settings.KafkaConfiguration.count("ssl.ca.location"), 0u);
}

TEST_F(ClientConfigBuilderTest, NoBrokersIsAnError) {
  Auth.Brokers.clear();
  EXPECT_THROW(buildBrokerSettings(Auth), ConfigurationError);
}

TEST_F(ClientConfigBuilderTest, SslSetsCertificatePaths) {
  Auth.Protocol = SecurityProtocol::Ssl;
  Auth.Tls = TlsConfig{"/ca.pem", "/cert.pem", "/key.pem"};
  auto Settings = buildBrokerSettings(Auth);
  EXPECT_EQ(Settings.KafkaConfiguration.at("security.protocol"), "ssl");
  EXPECT_EQ(Settings.KafkaConfiguration.at("ssl.ca.location"), "/ca.pem");
  EXPECT_EQ(Settings.KafkaConfiguration.at("ssl.certificate.location"),
            "/cert.pem");
  EXPECT_EQ(Settings.KafkaConfiguration.at("ssl.key.location"), "/key.pem");
}

TEST_F(ClientConfigBuilderTest, SslWithoutTlsSettingsFails) {
  Auth.Protocol = SecurityProtocol::Ssl;
  EXPECT_THROW(buildBrokerSettings(Auth), ConfigurationError);
}

TEST_F(ClientConfigBuilderTest, SslWithMissingPathFails) {
  Auth.Protocol = SecurityProtocol::Ssl;
  Auth.Tls = TlsConfig{"/ca.pem", "", "/key.pem"};
  EXPECT_THROW(buildBrokerSettings(Auth), ConfigurationError);
}

TEST_F(ClientConfigBuilderTest, SaslIsNotImplemented) {
  Auth.Protocol = SecurityProtocol::SaslPlaintext;
  EXPECT_THROW(buildBrokerSettings(Auth), NotImplementedError);
  Auth.Protocol = SecurityProtocol::SaslSsl;
  Auth.Tls = TlsConfig{"/ca.pem", "/cert.pem", "/key.pem"};
  EXPECT_THROW(buildBrokerSettings(Auth), NotImplementedError);
}

TEST_F(ClientConfigBuilderTest, ExtraPropertiesArePassedOn) {
  Auth.KafkaProperties["queued.min.messages"] = "1000";
  auto Settings = buildBrokerSettings(Auth);
  EXPECT_EQ(Settings.KafkaConfiguration.at("queued.min.messages"), "1000");
}

TEST_F(ClientConfigBuilderTest, SecurityPropertiesCanNotBeOverridden) {
  Auth.KafkaProperties["security.protocol"] = "ssl";
  EXPECT_THROW(buildBrokerSettings(Auth), ConfigurationError);
}

TEST_F(ClientConfigBuilderTest, ConsumerSettings) {
  ConsumerConfig Config;
  Config.Auth = Auth;
  Config.GroupId = "my-group";
  auto Settings = buildConsumerSettings(Config);
  EXPECT_EQ(Settings.KafkaConfiguration.at("group.id"), "my-group");
  EXPECT_EQ(Settings.KafkaConfiguration.at("enable.partition.eof"), "false");
  EXPECT_EQ(Settings.KafkaConfiguration.at("session.timeout.ms"), "6000");
  EXPECT_EQ(Settings.KafkaConfiguration.at("enable.auto.commit"), "false");
}

TEST_F(ClientConfigBuilderTest, ConsumerGroupIsGeneratedIfMissing) {
  ConsumerConfig Config;
  Config.Auth = Auth;
  auto Settings = buildConsumerSettings(Config);
  EXPECT_EQ(Settings.KafkaConfiguration.at("group.id").rfind("kafcat--host:", 0),
            0u);
}

TEST_F(ClientConfigBuilderTest, ProducerSettings) {
  ProducerConfig Config{"topic", Auth};
  auto Settings = buildProducerSettings(Config);
  EXPECT_EQ(Settings.KafkaConfiguration.at("message.timeout.ms"), "5000");
  EXPECT_EQ(Settings.KafkaConfiguration.count("group.id"), 0u);
}

TEST(SecurityProtocol, ParseIgnoresCase) {
  EXPECT_EQ(parseSecurityProtocol("SSL"), SecurityProtocol::Ssl);
  EXPECT_EQ(parseSecurityProtocol("sasl_plaintext"),
            SecurityProtocol::SaslPlaintext);
  EXPECT_THROW(parseSecurityProtocol("tls"), ConfigurationError);
}
