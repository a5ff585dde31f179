#pragma once

#include "notemarker/log.h"

#include <cstdint>
#include <optional>
#include <string>

namespace notemarker {

/**
 * Musical ticks per quarter note used by the host for bars|beats|ticks.
 */
constexpr int64_t kTicksPerBeat = 960000;

/**
 * 35 mm film conventions for feet+frames positions.
 */
constexpr int kFilmFramesPerFoot = 16;
constexpr double kFilmFrameRate = 24.0;

/**
 * Defaults applied until a session reports its own timing.
 */
constexpr int kDefaultSampleRate = 48000;
constexpr double kDefaultFrameRate = 29.97;

/**
 * Time encodings accepted for marker positions, in detection priority order.
 */
enum class TimeFormat {
  kTimecode,      // HH:MM:SS:FF (or HH:MM:SS.FF)
  kSamples,       // integer sample count
  kBarsBeats,     // |bars|beats|ticks
  kMilliseconds,  // 1500ms, 500.5ms
  kFeetFrames,    // feet+frames
};

/**
 * Position reference stored with a memory location. Bars|beats positions are
 * musical and cannot be mapped to absolute samples without tempo data.
 */
enum class TimeReference {
  kAbsolute,
  kBarBeat,
};

enum class ConversionError {
  kNone,
  kInvalidTime,                   // string does not parse in its detected format
  kOutOfRange,                    // parses, but a field is out of range
  kInsufficientTempoInformation,  // bars|beats without a tempo map
};

/**
 * Sample rate and timecode frame rate of a session.
 */
struct SessionTiming {
  /// Session sample rate in Hz.
  int sample_rate = kDefaultSampleRate;
  /// Timecode frame rate in frames per second (29.97, 23.976, ...).
  double frame_rate = kDefaultFrameRate;

  bool Validate(std::string* error = nullptr) const;
  bool operator==(const SessionTiming& other) const;
  bool operator!=(const SessionTiming& other) const { return !(*this == other); }
};

struct TimeValidation {
  bool is_valid = false;
  TimeFormat detected_format = TimeFormat::kTimecode;
  /// True when no format was expected or the detected format matches it.
  bool format_matches = true;
  /// Description of the first failed check, empty when valid.
  std::string error;
};

/**
 * Detects, validates and converts time strings against one session's timing.
 *
 * Detection never fails: a string matching no pattern is treated as timecode
 * (kFallbackFormat) and a warning is logged. Validation and conversion of such
 * a string then fail normally.
 */
class TimeFormatConverter {
 public:
  static constexpr TimeFormat kFallbackFormat = TimeFormat::kTimecode;

  explicit TimeFormatConverter(SessionTiming timing = {}, LogCallback log_callback = {});

  /// Replace the session parameters. Does not log, so callers may hold a lock.
  void SetSessionTiming(const SessionTiming& timing);
  const SessionTiming& timing() const { return timing_; }

  TimeFormat DetectFormat(const std::string& time) const;

  TimeValidation Validate(const std::string& time,
                          std::optional<TimeFormat> expected = std::nullopt) const;

  /**
   * Convert a time string to an absolute sample position.
   *
   * Timecode and milliseconds are floored to whole samples. Feet+frames use a
   * fixed 24 fps film rate. Bars|beats always fail with
   * kInsufficientTempoInformation.
   *
   * @return true on success; on failure *error (if given) says why.
   */
  bool ToSamples(const std::string& time, int64_t* samples,
                 ConversionError* error = nullptr) const;

  TimeReference ReferenceFor(const std::string& time) const;

  /// Format a sample position as HH:MM:SS:FF at the session frame rate.
  std::string SamplesToTimecode(int64_t samples) const;

 private:
  SessionTiming timing_;
  LogCallback log_callback_;
};

const char* TimeFormatName(TimeFormat format);
const char* ConversionErrorName(ConversionError error);

}  // namespace notemarker
