#include "notemarker/protocol.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace notemarker {
namespace {

constexpr const char kTimecodeRatePrefix[] = "STCR_";
constexpr const char kSampleRatePrefix[] = "SR_";

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Lowercase and drop separators so "Main Ruler", "main_ruler" and
// "MainRuler" compare equal.
std::string NormalizeName(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '_' || c == '-' || std::isspace(c)) {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

std::string StripPrefix(const std::string& text, const char* prefix) {
  const std::string p(prefix);
  if (text.rfind(p, 0) == 0) {
    return text.substr(p.size());
  }
  return text;
}

bool StripSuffix(std::string* text, const char* suffix) {
  const std::string s(suffix);
  if (text->size() > s.size() && text->compare(text->size() - s.size(), s.size(), s) == 0) {
    text->erase(text->size() - s.size());
    return true;
  }
  return false;
}

std::string FormatRate(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

}  // namespace

const char* CommandIdName(CommandId command) {
  switch (command) {
    case CommandId::kGetTrackList:
      return "GetTrackList";
    case CommandId::kGetSessionSampleRate:
      return "GetSessionSampleRate";
    case CommandId::kGetSessionTimeCodeRate:
      return "GetSessionTimeCodeRate";
    case CommandId::kGetSessionName:
      return "GetSessionName";
    case CommandId::kGetMemoryLocations:
      return "GetMemoryLocations";
    case CommandId::kRegisterConnection:
      return "RegisterConnection";
    case CommandId::kCreateMemoryLocation:
      return "CreateMemoryLocation";
    case CommandId::kCreateNewTracks:
      return "CreateNewTracks";
    case CommandId::kHostReadyCheck:
      return "HostReadyCheck";
  }
  return "Unknown";
}

const char* TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kQueued:
      return "Queued";
    case TaskStatus::kPending:
      return "Pending";
    case TaskStatus::kInProgress:
      return "InProgress";
    case TaskStatus::kCompleted:
      return "Completed";
    case TaskStatus::kFailed:
      return "Failed";
    case TaskStatus::kBlockedByOtherTask:
      return "BlockedByOtherTask";
    case TaskStatus::kCompletedWithBadResults:
      return "CompletedWithBadResults";
    case TaskStatus::kCanceled:
      return "Canceled";
  }
  return "Unknown";
}

const char* WireName(MarkerLocation location) {
  switch (location) {
    case MarkerLocation::kMainRuler:
      return "MarkerLocation_MainRuler";
    case MarkerLocation::kTrack:
      return "MarkerLocation_Track";
    case MarkerLocation::kNamedRuler:
      return "MarkerLocation_NamedRuler";
  }
  return "MarkerLocation_MainRuler";
}

const char* WireName(MemoryLocationReference reference) {
  switch (reference) {
    case MemoryLocationReference::kAbsolute:
      return "MLReference_Absolute";
    case MemoryLocationReference::kBarBeat:
      return "MLReference_BarBeat";
    case MemoryLocationReference::kFollowTrackTimebase:
      return "MLReference_FollowTrackTimebase";
  }
  return "MLReference_Absolute";
}

const char* WireName(TimeProperties properties) {
  switch (properties) {
    case TimeProperties::kMarker:
      return "TProperties_Marker";
    case TimeProperties::kSelection:
      return "TProperties_Selection";
  }
  return "TProperties_Marker";
}

const char* WireName(TrackType type) {
  switch (type) {
    case TrackType::kAudio:
      return "AudioTrack";
    case TrackType::kMidi:
      return "Midi";
    case TrackType::kAux:
      return "Aux";
    case TrackType::kInstrument:
      return "Instrument";
    case TrackType::kVca:
      return "Vca";
  }
  return "AudioTrack";
}

const char* WireName(TrackFormat format) {
  switch (format) {
    case TrackFormat::kMono:
      return "TFormat_Mono";
    case TrackFormat::kStereo:
      return "TFormat_Stereo";
    case TrackFormat::kLcr:
      return "TFormat_LCR";
  }
  return "TFormat_Mono";
}

bool ParseMarkerLocation(const std::string& name, MarkerLocation* out) {
  const std::string key = NormalizeName(name);
  if (key == "mainruler") {
    *out = MarkerLocation::kMainRuler;
  } else if (key == "track") {
    *out = MarkerLocation::kTrack;
  } else if (key == "namedruler") {
    *out = MarkerLocation::kNamedRuler;
  } else {
    return false;
  }
  return true;
}

bool ParseMemoryLocationReference(const std::string& name, MemoryLocationReference* out) {
  const std::string key = NormalizeName(name);
  if (key == "absolute") {
    *out = MemoryLocationReference::kAbsolute;
  } else if (key == "barbeat") {
    *out = MemoryLocationReference::kBarBeat;
  } else if (key == "followtracktime" || key == "followtracktimebase") {
    *out = MemoryLocationReference::kFollowTrackTimebase;
  } else {
    return false;
  }
  return true;
}

bool ParseTrackType(const std::string& name, TrackType* out) {
  const std::string key = NormalizeName(name);
  if (key == "audio" || key == "audiotrack") {
    *out = TrackType::kAudio;
  } else if (key == "midi") {
    *out = TrackType::kMidi;
  } else if (key == "aux" || key == "auxinput") {
    *out = TrackType::kAux;
  } else if (key == "instrument") {
    *out = TrackType::kInstrument;
  } else if (key == "vca") {
    *out = TrackType::kVca;
  } else {
    return false;
  }
  return true;
}

bool ParseTrackFormat(const std::string& name, TrackFormat* out) {
  const std::string key = NormalizeName(name);
  if (key == "mono") {
    *out = TrackFormat::kMono;
  } else if (key == "stereo") {
    *out = TrackFormat::kStereo;
  } else if (key == "lcr") {
    *out = TrackFormat::kLcr;
  } else {
    return false;
  }
  return true;
}

const std::vector<TimecodeRate>& TimecodeRates() {
  static const std::vector<TimecodeRate> rates = {
      {"STCR_Fps23976", 23.976, false},   {"STCR_Fps24", 24.0, false},
      {"STCR_Fps25", 25.0, false},        {"STCR_Fps2997", 29.97, false},
      {"STCR_Fps2997Drop", 29.97, true},  {"STCR_Fps30", 30.0, false},
      {"STCR_Fps30Drop", 30.0, true},     {"STCR_Fps47952", 47.952, false},
      {"STCR_Fps48", 48.0, false},        {"STCR_Fps50", 50.0, false},
      {"STCR_Fps5994", 59.94, false},     {"STCR_Fps5994Drop", 59.94, true},
      {"STCR_Fps60", 60.0, false},        {"STCR_Fps60Drop", 60.0, true},
      {"STCR_Fps100", 100.0, false},      {"STCR_Fps11988", 119.88, false},
      {"STCR_Fps11988Drop", 119.88, true}, {"STCR_Fps120", 120.0, false},
      {"STCR_Fps120Drop", 120.0, true},
  };
  return rates;
}

std::optional<TimecodeRate> ParseTimecodeRateSymbol(const std::string& symbol) {
  const std::string bare = StripPrefix(symbol, kTimecodeRatePrefix);
  for (const auto& rate : TimecodeRates()) {
    if (StripPrefix(rate.symbol, kTimecodeRatePrefix) == bare) {
      return rate;
    }
  }
  return std::nullopt;
}

std::optional<TimecodeRate> ParseFrameRate(const std::string& text) {
  if (auto symbol = ParseTimecodeRateSymbol(text)) {
    return symbol;
  }
  std::string lowered = Lowercase(text);
  lowered.erase(std::remove_if(lowered.begin(), lowered.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                lowered.end());
  bool drop = false;
  if (!StripSuffix(&lowered, "ndf")) {
    drop = StripSuffix(&lowered, "dropframe") || StripSuffix(&lowered, "drop") ||
           StripSuffix(&lowered, "df");
  }
  StripSuffix(&lowered, "fps");
  if (lowered.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double fps = std::strtod(lowered.c_str(), &end);
  if (end != lowered.c_str() + lowered.size() || !std::isfinite(fps)) {
    return std::nullopt;
  }
  for (const auto& rate : TimecodeRates()) {
    // Exports often round 23.976 to 23.98 and 29.97 to 29.970.
    if (rate.drop_frame == drop && std::fabs(rate.fps - fps) < 0.01) {
      return rate;
    }
  }
  return std::nullopt;
}

std::string TimecodeRateDisplayName(const TimecodeRate& rate) {
  if (rate.fps <= 0.0) {
    return rate.symbol;
  }
  std::string name = FormatRate(rate.fps) + " fps";
  if (rate.drop_frame) {
    name += " (Drop Frame)";
  }
  return name;
}

std::optional<int> ParseSampleRateSymbol(const std::string& symbol) {
  const std::string bare = StripPrefix(symbol, kSampleRatePrefix);
  int value = 0;
  const char* first = bare.data();
  const char* last = bare.data() + bare.size();
  const auto result = std::from_chars(first, last, value);
  if (bare.empty() || result.ec != std::errc() || result.ptr != last || value <= 0) {
    return std::nullopt;
  }
  return value;
}

std::string SampleRateSymbol(int sample_rate) {
  return std::string(kSampleRatePrefix) + std::to_string(sample_rate);
}

std::string SampleRateDisplayName(int sample_rate) {
  return FormatRate(sample_rate / 1000.0) + " kHz";
}

bool IsCommonSampleRate(int sample_rate) {
  static const int kCommonRates[] = {44100, 48000, 88200, 96000, 176400, 192000};
  return std::find(std::begin(kCommonRates), std::end(kCommonRates), sample_rate) !=
         std::end(kCommonRates);
}

bool IsSupportedTimecodeRate(const TimecodeRate& rate) {
  static const char* const kSupported[] = {
      "STCR_Fps23976", "STCR_Fps24",     "STCR_Fps25", "STCR_Fps2997",
      "STCR_Fps2997Drop", "STCR_Fps30Drop", "STCR_Fps30", "STCR_Fps50",
      "STCR_Fps5994",  "STCR_Fps60",
  };
  for (const char* symbol : kSupported) {
    if (rate.symbol == symbol) {
      return true;
    }
  }
  return false;
}

}  // namespace notemarker
