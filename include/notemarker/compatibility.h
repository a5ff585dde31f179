#pragma once

#include "notemarker/comments.h"
#include "notemarker/log.h"
#include "notemarker/protocol.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace notemarker {

/**
 * Session properties reported by the host.
 */
struct SessionInfo {
  std::string name;
  /// Host symbol as received, e.g. "SR_48000".
  std::string sample_rate_symbol;
  /// Parsed from sample_rate_symbol; empty if the symbol is not recognized.
  std::optional<int> sample_rate;
  /// Host symbol as received, e.g. "STCR_Fps2997".
  std::string timecode_rate_symbol;
  /// Parsed from timecode_rate_symbol; empty if the symbol is not recognized.
  std::optional<TimecodeRate> timecode_rate;
  /// Timecode rates the session could be switched to.
  std::vector<std::string> possible_timecode_rates;
};

struct CompatibilityIssue {
  /// Stable identifier, e.g. "FRAME_RATE_MISMATCH".
  std::string type;
  std::string message;
  /// What goes wrong if the issue is ignored.
  std::string impact;
  /// How to fix it.
  std::string resolution;
};

struct CompatibilitySummary {
  /// "COMPATIBLE" or "INCOMPATIBLE".
  std::string status;
  std::string session_name;
  std::string readable_frame_rate;
  std::string readable_sample_rate;
  size_t critical_issues = 0;
  size_t minor_issues = 0;
  size_t recommendations = 0;
  std::string status_message;
};

/**
 * Pre-flight result for a marker batch. Errors block marker creation;
 * warnings and recommendations do not.
 */
struct CompatibilityReport {
  SessionInfo session_info;
  bool is_compatible = true;
  std::vector<CompatibilityIssue> errors;
  std::vector<CompatibilityIssue> warnings;
  std::vector<CompatibilityIssue> recommendations;
  /// is_compatible and no errors.
  bool marker_creation_ready = false;
  CompatibilitySummary summary;

  /// True if any list holds an issue of this type.
  bool HasIssue(const std::string& type) const;
};

/// Batches above this size get a LARGE_COMMENT_COUNT warning.
constexpr size_t kLargeCommentBatch = 1000;

/**
 * Check session info, and optionally a comment batch, for marker creation.
 * Pure function; no connection needed.
 */
CompatibilityReport BuildCompatibilityReport(const SessionInfo& info,
                                             const CommentBatch* batch = nullptr,
                                             const LogCallback& log_callback = {});

}  // namespace notemarker
