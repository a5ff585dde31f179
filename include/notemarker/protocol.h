#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace notemarker {

/**
 * Default PTSL endpoint of a local Pro Tools instance.
 */
constexpr const char* kDefaultHost = "localhost";
constexpr uint16_t kDefaultPort = 31416;

/**
 * gRPC method paths of the PTSL service.
 */
constexpr const char* kSendRequestMethod = "/ptsl.PTSL/SendGrpcRequest";
constexpr const char* kSendStreamingRequestMethod = "/ptsl.PTSL/SendGrpcStreamingRequest";

/**
 * PTSL command identifiers used by this client.
 */
enum class CommandId : int32_t {
  kGetTrackList = 3,
  kGetSessionSampleRate = 35,
  kGetSessionTimeCodeRate = 38,
  kGetSessionName = 42,
  kGetMemoryLocations = 65,
  kRegisterConnection = 70,
  kCreateMemoryLocation = 71,
  kCreateNewTracks = 72,
  kHostReadyCheck = 92,
};

const char* CommandIdName(CommandId command);

/**
 * Completion status carried in every response header. Only kCompleted is
 * success; a transport-successful call can still carry any other status.
 */
enum class TaskStatus {
  kQueued,
  kPending,
  kInProgress,
  kCompleted,
  kFailed,
  kBlockedByOtherTask,
  kCompletedWithBadResults,
  kCanceled,
};

const char* TaskStatusName(TaskStatus status);

/**
 * Protocol version triple sent in every request header.
 */
struct ProtocolVersion {
  int32_t major_version = 2025;
  int32_t minor_version = 6;
  int32_t revision = 0;
};

/**
 * One outbound command: header fields plus the JSON body.
 */
struct CommandEnvelope {
  /// Unique per process lifetime.
  std::string task_id;
  CommandId command = CommandId::kHostReadyCheck;
  ProtocolVersion version;
  /// Empty only for RegisterConnection.
  std::string session_id;
  /// Serialized JSON body; empty for commands without parameters.
  std::string body_json;
};

/**
 * One inbound response.
 */
struct CommandResponse {
  std::string task_id;
  int32_t command = 0;
  TaskStatus status = TaskStatus::kQueued;
  int32_t progress = 0;
  std::string body_json;
  std::string error_json;

  bool succeeded() const { return status == TaskStatus::kCompleted; }
};

/**
 * Where a memory location is displayed.
 */
enum class MarkerLocation {
  kMainRuler,
  kTrack,
  kNamedRuler,
};

/**
 * How a memory location's position is anchored.
 */
enum class MemoryLocationReference {
  kAbsolute,
  kBarBeat,
  kFollowTrackTimebase,
};

enum class TimeProperties {
  kMarker,
  kSelection,
};

enum class TrackType {
  kAudio,
  kMidi,
  kAux,
  kInstrument,
  kVca,
};

enum class TrackFormat {
  kMono,
  kStereo,
  kLcr,
};

// Wire names as the host expects them in JSON bodies.
const char* WireName(MarkerLocation location);
const char* WireName(MemoryLocationReference reference);
const char* WireName(TimeProperties properties);
const char* WireName(TrackType type);
const char* WireName(TrackFormat format);

// Parse user-facing names ("main_ruler", "stereo", ...). Case-insensitive.
// Unknown names return false and leave *out untouched.
bool ParseMarkerLocation(const std::string& name, MarkerLocation* out);
bool ParseMemoryLocationReference(const std::string& name, MemoryLocationReference* out);
bool ParseTrackType(const std::string& name, TrackType* out);
bool ParseTrackFormat(const std::string& name, TrackFormat* out);

/**
 * A session timecode rate as reported by the host ("STCR_Fps2997Drop").
 */
struct TimecodeRate {
  /// Host symbol, e.g. "STCR_Fps2997Drop".
  std::string symbol;
  /// Nominal frames per second, e.g. 29.97.
  double fps = 0.0;
  bool drop_frame = false;
};

/// Every timecode rate symbol the host can report, in ascending rate order.
const std::vector<TimecodeRate>& TimecodeRates();

/**
 * Parse a host timecode rate symbol. Accepts the symbol with or without the
 * "STCR_" prefix. Unknown symbols return std::nullopt.
 */
std::optional<TimecodeRate> ParseTimecodeRateSymbol(const std::string& symbol);

/**
 * Parse a frame rate written by a person or an export ("24", "23.976",
 * "29.97drop", "29.97 DF", "STCR_Fps24"). Returns the matching host rate.
 */
std::optional<TimecodeRate> ParseFrameRate(const std::string& text);

/// "29.97 fps (Drop Frame)"; unknown rates fall back to the symbol.
std::string TimecodeRateDisplayName(const TimecodeRate& rate);

/// Parse "SR_48000" (or a bare "48000") into Hz.
std::optional<int> ParseSampleRateSymbol(const std::string& symbol);
std::string SampleRateSymbol(int sample_rate);
/// "48 kHz", "44.1 kHz".
std::string SampleRateDisplayName(int sample_rate);

/// Sample rates accepted for marker creation without a warning.
bool IsCommonSampleRate(int sample_rate);
/// Timecode rates that review exports can be matched against.
bool IsSupportedTimecodeRate(const TimecodeRate& rate);

}  // namespace notemarker
