#include "notemarker/time_format.h"

#include "logging.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

namespace notemarker {
namespace {

// Detection patterns, tried in TimeFormat order.
const std::regex& TimecodePattern() {
  static const std::regex pattern(R"(^([0-9]{1,2}):([0-9]{2}):([0-9]{2})[:.]([0-9]{2,3})$)");
  return pattern;
}

const std::regex& SamplesPattern() {
  static const std::regex pattern(R"(^-?[0-9]+$)");
  return pattern;
}

const std::regex& BarsBeatsPattern() {
  static const std::regex pattern(R"(^\|?([0-9]+)\|([0-9]+)\|([0-9]+)$)");
  return pattern;
}

const std::regex& MillisecondsPattern() {
  static const std::regex pattern(R"(^(-?[0-9]+(?:\.[0-9]+)?)\s*ms$)");
  return pattern;
}

const std::regex& FeetFramesPattern() {
  static const std::regex pattern(R"(^([0-9]+)\+([0-9]{1,2})$)");
  return pattern;
}

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool ParseInt(const std::string& text, int64_t* out) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  int64_t value = 0;
  const auto result = std::from_chars(first, last, value);
  if (result.ec != std::errc() || result.ptr != last) {
    return false;
  }
  *out = value;
  return true;
}

struct TimecodeFields {
  int64_t hours = 0;
  int64_t minutes = 0;
  int64_t seconds = 0;
  int64_t frames = 0;
};

struct BarsBeatsFields {
  int64_t bars = 0;
  int64_t beats = 0;
  int64_t ticks = 0;
};

struct FeetFramesFields {
  int64_t feet = 0;
  int64_t frames = 0;
};

bool MatchTimecode(const std::string& time, TimecodeFields* out) {
  std::smatch match;
  if (!std::regex_match(time, match, TimecodePattern())) {
    return false;
  }
  return ParseInt(match[1].str(), &out->hours) &&
         ParseInt(match[2].str(), &out->minutes) &&
         ParseInt(match[3].str(), &out->seconds) &&
         ParseInt(match[4].str(), &out->frames);
}

bool MatchBarsBeats(const std::string& time, BarsBeatsFields* out) {
  std::smatch match;
  if (!std::regex_match(time, match, BarsBeatsPattern())) {
    return false;
  }
  return ParseInt(match[1].str(), &out->bars) &&
         ParseInt(match[2].str(), &out->beats) &&
         ParseInt(match[3].str(), &out->ticks);
}

bool MatchMilliseconds(const std::string& time, double* out) {
  std::smatch match;
  if (!std::regex_match(time, match, MillisecondsPattern())) {
    return false;
  }
  const std::string number = match[1].str();
  char* end = nullptr;
  const double value = std::strtod(number.c_str(), &end);
  if (end != number.c_str() + number.size()) {
    return false;
  }
  *out = value;
  return true;
}

bool MatchFeetFrames(const std::string& time, FeetFramesFields* out) {
  std::smatch match;
  if (!std::regex_match(time, match, FeetFramesPattern())) {
    return false;
  }
  return ParseInt(match[1].str(), &out->feet) &&
         ParseInt(match[2].str(), &out->frames);
}

// Largest frame number accepted at a frame rate (exclusive bound).
int64_t FrameLimit(double frame_rate) {
  return static_cast<int64_t>(std::floor(frame_rate));
}

}  // namespace

bool SessionTiming::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (sample_rate <= 0) {
    return fail("sample_rate must be positive");
  }
  if (!std::isfinite(frame_rate) || frame_rate < 1.0) {
    return fail("frame_rate must be at least 1 fps");
  }
  return true;
}

bool SessionTiming::operator==(const SessionTiming& other) const {
  return sample_rate == other.sample_rate &&
         std::fabs(frame_rate - other.frame_rate) < 1e-9;
}

TimeFormatConverter::TimeFormatConverter(SessionTiming timing, LogCallback log_callback)
    : timing_(timing), log_callback_(std::move(log_callback)) {}

void TimeFormatConverter::SetSessionTiming(const SessionTiming& timing) { timing_ = timing; }

TimeFormat TimeFormatConverter::DetectFormat(const std::string& time) const {
  const std::string trimmed = Trim(time);
  if (std::regex_match(trimmed, TimecodePattern())) {
    return TimeFormat::kTimecode;
  }
  if (std::regex_match(trimmed, SamplesPattern())) {
    return TimeFormat::kSamples;
  }
  if (std::regex_match(trimmed, BarsBeatsPattern())) {
    return TimeFormat::kBarsBeats;
  }
  if (std::regex_match(trimmed, MillisecondsPattern())) {
    return TimeFormat::kMilliseconds;
  }
  if (std::regex_match(trimmed, FeetFramesPattern())) {
    return TimeFormat::kFeetFrames;
  }
  detail::LogWarn("unrecognized time format, treating as timecode: \"" + time + "\"",
                  log_callback_);
  return kFallbackFormat;
}

TimeValidation TimeFormatConverter::Validate(const std::string& time,
                                             std::optional<TimeFormat> expected) const {
  TimeValidation result;
  const std::string trimmed = Trim(time);
  result.detected_format = DetectFormat(trimmed);
  result.format_matches = !expected.has_value() || *expected == result.detected_format;

  bool valid = false;
  switch (result.detected_format) {
    case TimeFormat::kTimecode: {
      TimecodeFields tc;
      if (!MatchTimecode(trimmed, &tc)) {
        result.error = "not a timecode (HH:MM:SS:FF)";
      } else if (tc.minutes >= 60 || tc.seconds >= 60) {
        result.error = "timecode minutes and seconds must be below 60";
      } else if (tc.frames >= FrameLimit(timing_.frame_rate)) {
        std::ostringstream oss;
        oss << "timecode frame " << tc.frames << " out of range for "
            << timing_.frame_rate << " fps";
        result.error = oss.str();
      } else {
        valid = true;
      }
      break;
    }
    case TimeFormat::kSamples: {
      int64_t samples = 0;
      if (!ParseInt(trimmed, &samples)) {
        result.error = "sample count out of range";
      } else {
        valid = true;
      }
      break;
    }
    case TimeFormat::kBarsBeats: {
      BarsBeatsFields bb;
      if (!MatchBarsBeats(trimmed, &bb)) {
        result.error = "malformed bars|beats|ticks";
      } else if (bb.bars < 1 || bb.beats < 1) {
        result.error = "bars and beats start at 1";
      } else if (bb.ticks < 0 || bb.ticks >= kTicksPerBeat) {
        result.error = "ticks must be below 960000";
      } else {
        valid = true;
      }
      break;
    }
    case TimeFormat::kMilliseconds: {
      double ms = 0.0;
      if (!MatchMilliseconds(trimmed, &ms) || !std::isfinite(ms)) {
        result.error = "milliseconds value is not a finite number";
      } else {
        valid = true;
      }
      break;
    }
    case TimeFormat::kFeetFrames: {
      FeetFramesFields ff;
      if (!MatchFeetFrames(trimmed, &ff)) {
        result.error = "malformed feet+frames";
      } else if (ff.feet < 0 || ff.frames < 0 || ff.frames >= kFilmFramesPerFoot) {
        result.error = "feet+frames frame must be below 16";
      } else {
        valid = true;
      }
      break;
    }
  }
  if (valid && !result.format_matches) {
    result.error = std::string("expected ") + TimeFormatName(*expected) + ", got " +
                   TimeFormatName(result.detected_format);
  }
  result.is_valid = valid && result.format_matches;
  return result;
}

bool TimeFormatConverter::ToSamples(const std::string& time, int64_t* samples,
                                    ConversionError* error) const {
  auto fail = [&](ConversionError reason) {
    if (error) {
      *error = reason;
    }
    return false;
  };
  if (!samples) {
    return fail(ConversionError::kInvalidTime);
  }
  const std::string trimmed = Trim(time);
  const TimeFormat format = DetectFormat(trimmed);
  if (format == TimeFormat::kBarsBeats) {
    return fail(ConversionError::kInsufficientTempoInformation);
  }
  const TimeValidation validation = Validate(trimmed, format);
  if (!validation.is_valid) {
    // Distinguish "did not parse" from "parsed but out of range".
    bool parsed = false;
    switch (format) {
      case TimeFormat::kTimecode: {
        TimecodeFields tc;
        parsed = MatchTimecode(trimmed, &tc);
        break;
      }
      case TimeFormat::kFeetFrames: {
        FeetFramesFields ff;
        parsed = MatchFeetFrames(trimmed, &ff);
        break;
      }
      case TimeFormat::kSamples:
        parsed = std::regex_match(trimmed, SamplesPattern());
        break;
      case TimeFormat::kMilliseconds:
      case TimeFormat::kBarsBeats:
        parsed = false;
        break;
    }
    return fail(parsed ? ConversionError::kOutOfRange : ConversionError::kInvalidTime);
  }

  const double sample_rate = static_cast<double>(timing_.sample_rate);
  switch (format) {
    case TimeFormat::kTimecode: {
      TimecodeFields tc;
      MatchTimecode(trimmed, &tc);
      const double total_seconds =
          static_cast<double>(tc.hours * 3600 + tc.minutes * 60 + tc.seconds) +
          static_cast<double>(tc.frames) / timing_.frame_rate;
      *samples = static_cast<int64_t>(std::floor(total_seconds * sample_rate));
      break;
    }
    case TimeFormat::kSamples:
      ParseInt(trimmed, samples);
      break;
    case TimeFormat::kMilliseconds: {
      double ms = 0.0;
      MatchMilliseconds(trimmed, &ms);
      *samples = static_cast<int64_t>(std::floor((ms / 1000.0) * sample_rate));
      break;
    }
    case TimeFormat::kFeetFrames: {
      FeetFramesFields ff;
      MatchFeetFrames(trimmed, &ff);
      const int64_t total_frames = ff.feet * kFilmFramesPerFoot + ff.frames;
      const double seconds = static_cast<double>(total_frames) / kFilmFrameRate;
      *samples = static_cast<int64_t>(std::floor(seconds * sample_rate));
      break;
    }
    case TimeFormat::kBarsBeats:
      return fail(ConversionError::kInsufficientTempoInformation);
  }
  if (error) {
    *error = ConversionError::kNone;
  }
  return true;
}

TimeReference TimeFormatConverter::ReferenceFor(const std::string& time) const {
  return DetectFormat(time) == TimeFormat::kBarsBeats ? TimeReference::kBarBeat
                                                      : TimeReference::kAbsolute;
}

std::string TimeFormatConverter::SamplesToTimecode(int64_t samples) const {
  const int64_t sample_rate = timing_.sample_rate > 0 ? timing_.sample_rate : kDefaultSampleRate;
  if (samples < 0) {
    samples = 0;
  }
  const int64_t whole_seconds = samples / sample_rate;
  const int64_t remainder = samples % sample_rate;
  // ToSamples floors, so the frame that produced `remainder` is the floor of
  // (remainder + 1) scaled back to frames.
  int64_t frames = static_cast<int64_t>(std::floor(
      static_cast<double>(remainder + 1) * timing_.frame_rate / static_cast<double>(sample_rate) +
      1e-9));
  const int64_t max_frame = FrameLimit(timing_.frame_rate) - 1;
  if (frames > max_frame) {
    frames = max_frame > 0 ? max_frame : 0;
  }

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << whole_seconds / 3600 << ':'
      << std::setw(2) << (whole_seconds % 3600) / 60 << ':'
      << std::setw(2) << whole_seconds % 60 << ':'
      << std::setw(2) << frames;
  return oss.str();
}

const char* TimeFormatName(TimeFormat format) {
  switch (format) {
    case TimeFormat::kTimecode:
      return "timecode";
    case TimeFormat::kSamples:
      return "samples";
    case TimeFormat::kBarsBeats:
      return "bars_beats";
    case TimeFormat::kMilliseconds:
      return "milliseconds";
    case TimeFormat::kFeetFrames:
      return "feet_frames";
  }
  return "timecode";
}

const char* ConversionErrorName(ConversionError error) {
  switch (error) {
    case ConversionError::kNone:
      return "none";
    case ConversionError::kInvalidTime:
      return "invalid_time";
    case ConversionError::kOutOfRange:
      return "out_of_range";
    case ConversionError::kInsufficientTempoInformation:
      return "insufficient_tempo_information";
  }
  return "invalid_time";
}

}  // namespace notemarker
