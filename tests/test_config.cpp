// Tests for configuration validation.
#include "notemarker/client.h"

#include "fake_transport.h"

#include <gtest/gtest.h>

TEST(ConfigValidationTest, AcceptsDefaults) {
  notemarker::Config config;
  std::string error;
  EXPECT_TRUE(config.Validate(&error)) << error;
  EXPECT_EQ(config.host, "localhost");
  EXPECT_EQ(config.port, 31416);
}

TEST(ConfigValidationTest, RejectsEmptyHost) {
  notemarker::Config config;
  config.host.clear();
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("host"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsPortOutOfRange) {
  notemarker::Config config;
  config.port = 70000;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("port"), std::string::npos);
  config.port = 0;
  EXPECT_FALSE(config.Validate(&error));
}

TEST(ConfigValidationTest, RejectsEmptyCompanyName) {
  notemarker::Config config;
  config.company_name.clear();
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("company_name"), std::string::npos);
}

TEST(ConfigValidationTest, AllowsEmptyApplicationName) {
  notemarker::Config config;
  config.application_name.clear();
  EXPECT_TRUE(config.Validate());
}

TEST(ConfigValidationTest, RejectsNonPositiveTimeouts) {
  notemarker::Config config;
  config.registration_timeout = std::chrono::milliseconds(0);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("timeouts"), std::string::npos);
}

TEST(ConfigValidationTest, HeartbeatSettings) {
  notemarker::Config config;
  config.heartbeat_interval = std::chrono::milliseconds(0);
  EXPECT_TRUE(config.Validate());

  config.max_heartbeat_failures = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_heartbeat_failures"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsInvertedBackoff) {
  notemarker::Config config;
  config.initial_reconnect_backoff = std::chrono::milliseconds(5000);
  config.max_reconnect_backoff = std::chrono::milliseconds(1000);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_reconnect_backoff"), std::string::npos);
}

TEST(ConfigValidationTest, ConnectRejectsInvalidConfig) {
  auto host = std::make_shared<notemarker::fake::FakeHost>();
  notemarker::Config config = notemarker::fake::TestConfig();
  config.port = -1;
  notemarker::Client client(config, notemarker::fake::FactoryFor(host));

  notemarker::ClassifiedError error;
  EXPECT_FALSE(client.Connect(&error));
  EXPECT_EQ(error.type, notemarker::ErrorType::kUnknownError);
  EXPECT_NE(error.context.at("config").find("port"), std::string::npos);
  EXPECT_EQ(host->transports_created, 0);
  EXPECT_FALSE(client.IsConnected());
}
