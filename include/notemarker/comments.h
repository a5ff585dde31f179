#pragma once

#include "notemarker/message_builder.h"
#include "notemarker/protocol.h"

#include <optional>
#include <string>
#include <vector>

namespace notemarker {

/**
 * A timestamped reviewer comment from an external review export.
 */
struct ReviewComment {
  /// Author line as exported, e.g. "001 - Dana Reviewer - 3:41PM".
  std::string author;
  std::string text;
  /// Position of the comment, normally HH:MM:SS:FF.
  std::string timecode;
  /// Set for range comments.
  std::optional<std::string> end_timecode;
  bool is_reply = false;
};

/**
 * Comments imported together, with the frame rate the export declares.
 */
struct CommentBatch {
  /// As written by the exporter ("23.976", "29.97 DF", "STCR_Fps24", ...).
  std::optional<std::string> frame_rate;
  std::vector<ReviewComment> comments;
};

/**
 * Marker color palette indices.
 */
struct MarkerColors {
  int main = 0;
  int reply = 1;
  int note = 2;
  int warning = 3;
  int error = 4;
};

struct MarkerOptions {
  MarkerColors colors;
  std::optional<std::string> track_name;
  std::optional<MarkerLocation> location;
};

constexpr size_t kMaxMarkerNameLength = 64;
constexpr size_t kMaxTextNameLength = 30;

/// Replace characters the host rejects, collapse whitespace, trim, limit length.
std::string SanitizeMarkerName(const std::string& name);

/**
 * Marker name for a comment: the cleaned author, else the start of the
 * comment text, else "Marker <timecode>".
 */
std::string MarkerNameForComment(const ReviewComment& comment);

/// Reply color for replies, otherwise a keyword-based color.
int ChooseMarkerColor(const ReviewComment& comment, const MarkerColors& colors);

MarkerSpec MarkerFromComment(const ReviewComment& comment, const MarkerOptions& options = {});

std::vector<MarkerSpec> MarkersFromBatch(const CommentBatch& batch,
                                         const MarkerOptions& options = {});

}  // namespace notemarker
