// Tests for marker creation and batch behaviour.
#include "notemarker/client.h"

#include "fake_transport.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <mutex>
#include <vector>

namespace {

using notemarker::fake::CompletedWith;
using notemarker::fake::FactoryFor;
using notemarker::fake::FailedWith;
using notemarker::fake::FakeHost;
using notemarker::fake::SessionHandler;
using notemarker::fake::TestConfig;

notemarker::MarkerSpec Marker(const std::string& name, const std::string& start) {
  notemarker::MarkerSpec marker;
  marker.name = name;
  marker.start_time = start;
  return marker;
}

std::shared_ptr<FakeHost> SessionHost() {
  auto host = std::make_shared<FakeHost>();
  host->handler = SessionHandler();
  return host;
}

}  // namespace

TEST(BatchTest, ReportsProgressAfterEachMarker) {
  auto host = SessionHost();
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  std::vector<notemarker::BatchProgress> progress;
  const auto result = client.CreateMarkers(
      {Marker("A", "00:00:01:00"), Marker("B", "00:00:02:00"), Marker("C", "00:00:03:00")},
      [&](const notemarker::BatchProgress& update) { progress.push_back(update); });

  EXPECT_EQ(result.total, 3u);
  EXPECT_EQ(result.succeeded, 3u);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_FALSE(result.timing_changed);
  EXPECT_FALSE(result.error.has_value());
  ASSERT_EQ(progress.size(), 3u);
  EXPECT_EQ(progress[0].current, 1u);
  EXPECT_EQ(progress[0].total, 3u);
  EXPECT_NEAR(progress[0].percentage, 100.0 / 3.0, 1e-9);
  EXPECT_EQ(progress[1].marker_name, "B");
  EXPECT_DOUBLE_EQ(progress[2].percentage, 100.0);
}

TEST(BatchTest, FetchesTimingOnceWhenUnknown) {
  auto host = SessionHost();
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  client.CreateMarkers({Marker("A", "00:00:01:00")});
  client.CreateMarkers({Marker("B", "00:00:02:00")});

  const auto commands = host->SentCommands();
  ASSERT_GE(commands.size(), 6u);
  EXPECT_EQ(host->CountSent(notemarker::CommandId::kGetSessionName), 1u);
  EXPECT_EQ(host->CountSent(notemarker::CommandId::kGetSessionSampleRate), 1u);
  EXPECT_EQ(host->CountSent(notemarker::CommandId::kCreateMemoryLocation), 2u);
  EXPECT_EQ(commands.back(), notemarker::CommandId::kCreateMemoryLocation);
  EXPECT_TRUE(client.GetSession()->timing_known);
}

TEST(BatchTest, FailedMarkerDoesNotStopBatch) {
  auto host = std::make_shared<FakeHost>();
  auto session = SessionHandler();
  host->handler = [session](const notemarker::CommandEnvelope& envelope) {
    if (envelope.command == notemarker::CommandId::kCreateMemoryLocation &&
        nlohmann::json::parse(envelope.body_json)["name"] == "Rejected") {
      return FailedWith(
          R"({"errors":[{"command_error_type":"PT_InvalidParameter","command_error_message":"nope"}]})");
    }
    return session(envelope);
  };
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  const auto result = client.CreateMarkers({Marker("A", "00:00:01:00"),
                                            Marker("Rejected", "00:00:02:00"),
                                            Marker("Bad Time", "00:00:02:45"),
                                            Marker("D", "00:00:04:00")});
  EXPECT_EQ(result.succeeded, 2u);
  EXPECT_EQ(result.failed, 2u);
  ASSERT_EQ(result.items.size(), 4u);
  EXPECT_TRUE(result.items[0].success);
  EXPECT_FALSE(result.items[1].success);
  EXPECT_EQ(result.items[1].error->type, notemarker::ErrorType::kUnknownError);
  EXPECT_FALSE(result.items[2].success);
  EXPECT_EQ(result.items[2].error->type, notemarker::ErrorType::kParsingError);
  EXPECT_EQ(result.items[2].error->context.at("field"), "start_time");
  EXPECT_TRUE(result.items[3].success);
  EXPECT_EQ(host->CountSent(notemarker::CommandId::kCreateMemoryLocation), 3u);
}

TEST(BatchTest, TimingChangeRevalidatesRemainingMarkers) {
  auto host = SessionHost();
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  notemarker::SessionTiming pal;
  pal.sample_rate = 48000;
  pal.frame_rate = 25.0;

  // Frame 27 is valid at 29.97 fps but not at 25 fps.
  const auto result = client.CreateMarkers(
      {Marker("A", "00:00:01:27"), Marker("B", "00:00:02:27"), Marker("C", "00:00:03:10")},
      [&](const notemarker::BatchProgress& update) {
        if (update.current == 1) {
          notemarker::test::SetSessionTiming(client, pal);
        }
      });

  EXPECT_TRUE(result.timing_changed);
  ASSERT_EQ(result.items.size(), 3u);
  EXPECT_TRUE(result.items[0].success);
  EXPECT_FALSE(result.items[0].revalidated);
  EXPECT_FALSE(result.items[1].success);
  EXPECT_TRUE(result.items[1].revalidated);
  EXPECT_TRUE(result.items[2].success);
  EXPECT_TRUE(result.items[2].revalidated);
  EXPECT_EQ(client.GetSession()->timing, pal);
}

TEST(BatchTest, RequiresRegistration) {
  auto host = SessionHost();
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.Connect());

  const auto result = client.CreateMarkers({Marker("A", "00:00:01:00")});
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->type, notemarker::ErrorType::kSessionIdParseError);
  EXPECT_EQ(result.failed, 1u);
  EXPECT_TRUE(result.items.empty());
  EXPECT_TRUE(host->sent.empty());
}

TEST(BatchTest, UnreadableTimingStopsBatch) {
  auto host = std::make_shared<FakeHost>();
  host->handler = SessionHandler("Mix", "SR_48000", "STCR_Mystery");
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  const auto result = client.CreateMarkers({Marker("A", "00:00:01:00")});
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->type, notemarker::ErrorType::kParsingError);
  EXPECT_EQ(host->CountSent(notemarker::CommandId::kCreateMemoryLocation), 0u);
}

TEST(BatchTest, EmptyBatch) {
  auto host = SessionHost();
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());
  const auto result = client.CreateMarkers({});
  EXPECT_EQ(result.total, 0u);
  EXPECT_FALSE(result.error.has_value());
}

TEST(CreateMemoryLocationTest, UsesSessionTiming) {
  auto host = std::make_shared<FakeHost>();
  host->handler = SessionHandler("Mix", "SR_48000", "STCR_Fps24");
  notemarker::Client client(TestConfig(), FactoryFor(host));
  ASSERT_TRUE(client.ConnectAndRegister());

  notemarker::ClassifiedError error;
  EXPECT_FALSE(client.CreateMemoryLocation(Marker("Late", "00:00:00:24"), &error));
  EXPECT_EQ(error.type, notemarker::ErrorType::kParsingError);

  auto marker = Marker("Dana", "00:00:00:23");
  marker.comments = "tighten";
  ASSERT_TRUE(client.CreateMemoryLocation(marker, &error)) << error.message;

  std::lock_guard<std::mutex> lock(host->mutex);
  const auto body = nlohmann::json::parse(host->sent.back().body_json);
  EXPECT_EQ(body["name"], "Dana");
  EXPECT_EQ(body["comments"], "tighten");
  EXPECT_EQ(host->sent.back().session_id, "session-1");
}
