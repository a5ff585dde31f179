#include "notemarker/compatibility.h"

#include "notemarker/time_format.h"

#include <cmath>
#include <sstream>

namespace notemarker {
namespace {

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string FormatFps(double fps) {
  std::ostringstream oss;
  oss << fps;
  return oss.str();
}

void CheckSession(const SessionInfo& info, CompatibilityReport* report) {
  if (Trim(info.name).empty()) {
    report->errors.push_back({"MISSING_SESSION_NAME", "Pro Tools session has no name",
                              "Cannot determine session context for marker placement",
                              "Save the Pro Tools session with a proper name"});
    report->is_compatible = false;
  } else if (info.name.find("Untitled") != std::string::npos) {
    report->warnings.push_back({"UNTITLED_SESSION", "Pro Tools session appears to be untitled",
                                "May indicate unsaved work",
                                "Save session with descriptive name before adding markers"});
  }

  if (!info.sample_rate || !IsCommonSampleRate(*info.sample_rate)) {
    report->warnings.push_back(
        {"UNCOMMON_SAMPLE_RATE", "Uncommon sample rate detected: " + info.sample_rate_symbol,
         "Review timecode calculations may need verification",
         "Verify the review export matches this sample rate"});
  }

  if (!info.timecode_rate || !IsSupportedTimecodeRate(*info.timecode_rate)) {
    report->errors.push_back(
        {"INCOMPATIBLE_TIMECODE_RATE", "Unsupported timecode rate: " + info.timecode_rate_symbol,
         "Review timecode conversion will fail",
         "Change session timecode rate to a standard format (23.976, 24, 25, 29.97, 30)"});
    report->is_compatible = false;
  }

  if (info.timecode_rate ? info.timecode_rate->drop_frame
                         : info.timecode_rate_symbol.find("Drop") != std::string::npos) {
    report->recommendations.push_back(
        {"DROP_FRAME_DETECTED", "Drop frame timecode detected",
         "Requires precise timecode alignment with the review export",
         "Ensure the review export uses matching drop frame settings"});
  }
}

void CheckBatch(const SessionInfo& info, const CommentBatch& batch, const LogCallback& log_callback,
                CompatibilityReport* report) {
  if (batch.frame_rate && info.timecode_rate) {
    const std::optional<TimecodeRate> batch_rate = ParseFrameRate(*batch.frame_rate);
    if (!batch_rate) {
      report->errors.push_back(
          {"FRAME_RATE_MISMATCH",
           "Review frame rate \"" + *batch.frame_rate + "\" is not recognized",
           "Markers may be placed at incorrect timecode positions",
           "Re-export comments with a standard frame rate"});
      report->is_compatible = false;
    } else if (std::fabs(batch_rate->fps - info.timecode_rate->fps) > 0.001) {
      report->errors.push_back(
          {"FRAME_RATE_MISMATCH",
           "Review frame rate (" + FormatFps(batch_rate->fps) +
               "fps) doesn't match Pro Tools (" + FormatFps(info.timecode_rate->fps) + "fps)",
           "Markers will be placed at incorrect timecode positions",
           "Change Pro Tools session timecode rate to match the review export"});
      report->is_compatible = false;
    }
  }

  const size_t count = batch.comments.size();
  if (count == 0) {
    report->warnings.push_back({"NO_COMMENTS_FOUND", "No review comments found in data",
                                "No markers will be created",
                                "Verify the review export contains comments"});
  } else if (count > kLargeCommentBatch) {
    report->warnings.push_back(
        {"LARGE_COMMENT_COUNT", "Large number of comments detected (" + std::to_string(count) + ")",
         "Marker creation may take significant time",
         "Consider filtering comments or processing in batches"});
  }

  if (count > 0 && info.timecode_rate) {
    SessionTiming timing;
    timing.sample_rate = info.sample_rate.value_or(kDefaultSampleRate);
    timing.frame_rate = info.timecode_rate->fps;
    const TimeFormatConverter converter(timing, log_callback);
    size_t invalid = 0;
    for (const auto& comment : batch.comments) {
      if (!converter.Validate(comment.timecode).is_valid) {
        ++invalid;
      }
    }
    if (invalid > 0) {
      report->warnings.push_back(
          {"INVALID_COMMENT_TIMECODES",
           std::to_string(invalid) + " comment timecode(s) are not valid at " +
               FormatFps(timing.frame_rate) + " fps",
           "Those comments will not become markers",
           "Check the export frame rate and the affected comments"});
    }
  }
}

CompatibilitySummary Summarize(const CompatibilityReport& report) {
  const SessionInfo& info = report.session_info;
  CompatibilitySummary summary;
  summary.status = report.is_compatible ? "COMPATIBLE" : "INCOMPATIBLE";
  summary.session_name = info.name;
  summary.readable_frame_rate =
      info.timecode_rate ? TimecodeRateDisplayName(*info.timecode_rate) : info.timecode_rate_symbol;
  summary.readable_sample_rate =
      info.sample_rate ? SampleRateDisplayName(*info.sample_rate) : info.sample_rate_symbol;
  summary.critical_issues = report.errors.size();
  summary.minor_issues = report.warnings.size();
  summary.recommendations = report.recommendations.size();
  if (report.marker_creation_ready && report.warnings.empty()) {
    summary.status_message = "Session is fully ready for marker creation";
  } else if (report.is_compatible) {
    summary.status_message = "Session is compatible but has minor issues to address";
  } else {
    summary.status_message = "Session has compatibility issues that must be resolved";
  }
  return summary;
}

}  // namespace

bool CompatibilityReport::HasIssue(const std::string& type) const {
  for (const auto* list : {&errors, &warnings, &recommendations}) {
    for (const auto& issue : *list) {
      if (issue.type == type) {
        return true;
      }
    }
  }
  return false;
}

CompatibilityReport BuildCompatibilityReport(const SessionInfo& info, const CommentBatch* batch,
                                             const LogCallback& log_callback) {
  CompatibilityReport report;
  report.session_info = info;
  CheckSession(info, &report);
  if (batch) {
    CheckBatch(info, *batch, log_callback, &report);
  }
  report.marker_creation_ready = report.is_compatible && report.errors.empty();
  report.summary = Summarize(report);
  return report;
}

}  // namespace notemarker
