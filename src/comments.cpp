#include "notemarker/comments.h"

#include <algorithm>
#include <cctype>
#include <regex>

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

std::string CollapseWhitespace(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  bool in_space = false;
  for (unsigned char c : value) {
    if (std::isspace(c)) {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) {
      out.push_back(' ');
    }
    in_space = false;
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool ContainsAny(const std::string& text, std::initializer_list<const char*> words) {
  for (const char* word : words) {
    if (text.find(word) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string CleanAuthor(const std::string& author) {
  static const std::regex kReplyTag(R"(\s*\(reply\)\s*)", std::regex::icase);
  static const std::regex kClockTime(R"(\s*-\s*\d{1,2}:\d{2}\s*[ap]m.*$)", std::regex::icase);
  static const std::regex kLeadingIndex(R"(^\d+\s*-\s*)");
  std::string cleaned = std::regex_replace(Trim(author), kReplyTag, "");
  cleaned = std::regex_replace(cleaned, kClockTime, "");
  cleaned = std::regex_replace(cleaned, kLeadingIndex, "");
  return Trim(cleaned);
}

// Cut to at most `max_bytes` without splitting a UTF-8 sequence.
void TruncateUtf8(std::string* text, size_t max_bytes) {
  if (text->size() <= max_bytes) {
    return;
  }
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>((*text)[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  text->resize(cut);
}

}  // namespace

std::string SanitizeMarkerName(const std::string& name) {
  std::string replaced = name;
  for (char& c : replaced) {
    switch (c) {
      case '<':
      case '>':
      case ':':
      case '"':
      case '/':
      case '\\':
      case '|':
      case '?':
      case '*':
        c = '_';
        break;
      default:
        break;
    }
  }
  std::string out = CollapseWhitespace(replaced);
  TruncateUtf8(&out, kMaxMarkerNameLength);
  return out;
}

std::string MarkerNameForComment(const ReviewComment& comment) {
  const std::string author = CleanAuthor(comment.author);
  if (!author.empty()) {
    return SanitizeMarkerName(author);
  }
  std::string text = CollapseWhitespace(comment.text);
  if (!text.empty()) {
    TruncateUtf8(&text, kMaxTextNameLength);
    return SanitizeMarkerName(text);
  }
  const std::string timecode = comment.timecode.empty() ? "00:00:00:00" : comment.timecode;
  return SanitizeMarkerName("Marker " + timecode);
}

int ChooseMarkerColor(const ReviewComment& comment, const MarkerColors& colors) {
  if (comment.is_reply) {
    return colors.reply;
  }
  const std::string text = Lowercase(comment.text);
  if (ContainsAny(text, {"error", "problem", "issue"})) {
    return colors.error;
  }
  if (ContainsAny(text, {"warning", "caution", "careful"})) {
    return colors.warning;
  }
  if (ContainsAny(text, {"note", "reminder", "remember"})) {
    return colors.note;
  }
  return colors.main;
}

MarkerSpec MarkerFromComment(const ReviewComment& comment, const MarkerOptions& options) {
  MarkerSpec marker;
  marker.name = MarkerNameForComment(comment);
  marker.start_time = Trim(comment.timecode);
  if (comment.end_timecode && !Trim(*comment.end_timecode).empty()) {
    marker.end_time = Trim(*comment.end_timecode);
  }
  marker.comments = comment.text;
  marker.color_index = ChooseMarkerColor(comment, options.colors);
  marker.track_name = options.track_name;
  marker.location = options.location;
  return marker;
}

std::vector<MarkerSpec> MarkersFromBatch(const CommentBatch& batch, const MarkerOptions& options) {
  std::vector<MarkerSpec> markers;
  markers.reserve(batch.comments.size());
  for (const auto& comment : batch.comments) {
    markers.push_back(MarkerFromComment(comment, options));
  }
  return markers;
}

}  // namespace notemarker
