// Tests for host symbols and wire names.
#include "notemarker/protocol.h"

#include <gtest/gtest.h>

TEST(ProtocolTest, CommandIdsAndNames) {
  EXPECT_EQ(static_cast<int>(notemarker::CommandId::kRegisterConnection), 70);
  EXPECT_EQ(static_cast<int>(notemarker::CommandId::kCreateMemoryLocation), 71);
  EXPECT_EQ(static_cast<int>(notemarker::CommandId::kGetSessionName), 42);
  EXPECT_STREQ(notemarker::CommandIdName(notemarker::CommandId::kHostReadyCheck),
               "HostReadyCheck");
  EXPECT_STREQ(notemarker::TaskStatusName(notemarker::TaskStatus::kCompleted), "Completed");
}

TEST(ProtocolTest, OnlyCompletedIsSuccess) {
  notemarker::CommandResponse response;
  response.status = notemarker::TaskStatus::kCompletedWithBadResults;
  EXPECT_FALSE(response.succeeded());
  response.status = notemarker::TaskStatus::kCompleted;
  EXPECT_TRUE(response.succeeded());
}

TEST(ProtocolTest, ParsesTimecodeRateSymbols) {
  const auto rate = notemarker::ParseTimecodeRateSymbol("STCR_Fps2997Drop");
  ASSERT_TRUE(rate.has_value());
  EXPECT_NEAR(rate->fps, 29.97, 1e-9);
  EXPECT_TRUE(rate->drop_frame);

  const auto bare = notemarker::ParseTimecodeRateSymbol("Fps25");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->symbol, "STCR_Fps25");

  EXPECT_FALSE(notemarker::ParseTimecodeRateSymbol("STCR_Fps31").has_value());
  EXPECT_EQ(notemarker::TimecodeRates().size(), 19u);
}

TEST(ProtocolTest, ParsesHumanFrameRates) {
  EXPECT_EQ(notemarker::ParseFrameRate("24")->symbol, "STCR_Fps24");
  EXPECT_EQ(notemarker::ParseFrameRate("23.98")->symbol, "STCR_Fps23976");
  EXPECT_EQ(notemarker::ParseFrameRate("29.97 fps")->symbol, "STCR_Fps2997");
  EXPECT_EQ(notemarker::ParseFrameRate("29.97 DF")->symbol, "STCR_Fps2997Drop");
  EXPECT_EQ(notemarker::ParseFrameRate("29.97drop")->symbol, "STCR_Fps2997Drop");
  EXPECT_EQ(notemarker::ParseFrameRate("29.97 NDF")->symbol, "STCR_Fps2997");
  EXPECT_EQ(notemarker::ParseFrameRate("STCR_Fps50")->symbol, "STCR_Fps50");
  EXPECT_FALSE(notemarker::ParseFrameRate("fast").has_value());
  EXPECT_FALSE(notemarker::ParseFrameRate("").has_value());
}

TEST(ProtocolTest, SampleRateSymbols) {
  EXPECT_EQ(notemarker::ParseSampleRateSymbol("SR_48000").value(), 48000);
  EXPECT_EQ(notemarker::ParseSampleRateSymbol("96000").value(), 96000);
  EXPECT_FALSE(notemarker::ParseSampleRateSymbol("SR_").has_value());
  EXPECT_FALSE(notemarker::ParseSampleRateSymbol("SR_fast").has_value());
  EXPECT_EQ(notemarker::SampleRateSymbol(44100), "SR_44100");
  EXPECT_EQ(notemarker::SampleRateDisplayName(44100), "44.1 kHz");
  EXPECT_EQ(notemarker::SampleRateDisplayName(48000), "48 kHz");
  EXPECT_TRUE(notemarker::IsCommonSampleRate(96000));
  EXPECT_FALSE(notemarker::IsCommonSampleRate(32000));
}

TEST(ProtocolTest, SupportedRatesAndDisplayNames) {
  const auto drop = notemarker::ParseTimecodeRateSymbol("STCR_Fps2997Drop").value();
  EXPECT_TRUE(notemarker::IsSupportedTimecodeRate(drop));
  EXPECT_EQ(notemarker::TimecodeRateDisplayName(drop), "29.97 fps (Drop Frame)");
  EXPECT_FALSE(notemarker::IsSupportedTimecodeRate(
      notemarker::ParseTimecodeRateSymbol("STCR_Fps120").value()));
}

TEST(ProtocolTest, EnumNamesParseCaseInsensitively) {
  notemarker::MarkerLocation location = notemarker::MarkerLocation::kTrack;
  EXPECT_TRUE(notemarker::ParseMarkerLocation("Main Ruler", &location));
  EXPECT_EQ(location, notemarker::MarkerLocation::kMainRuler);
  EXPECT_FALSE(notemarker::ParseMarkerLocation("sidebar", &location));
  EXPECT_EQ(location, notemarker::MarkerLocation::kMainRuler);

  notemarker::TrackFormat format = notemarker::TrackFormat::kMono;
  EXPECT_TRUE(notemarker::ParseTrackFormat("STEREO", &format));
  EXPECT_STREQ(notemarker::WireName(format), "TFormat_Stereo");

  notemarker::TrackType type = notemarker::TrackType::kAudio;
  EXPECT_TRUE(notemarker::ParseTrackType("aux_input", &type));
  EXPECT_STREQ(notemarker::WireName(type), "Aux");

  notemarker::MemoryLocationReference reference = notemarker::MemoryLocationReference::kAbsolute;
  EXPECT_TRUE(notemarker::ParseMemoryLocationReference("bar-beat", &reference));
  EXPECT_STREQ(notemarker::WireName(reference), "MLReference_BarBeat");
}
