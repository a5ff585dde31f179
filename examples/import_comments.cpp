// Example: import review comments from a JSON export as session markers.
//
// Input format:
//   {"frame_rate": "23.976",
//    "comments": [{"author": "...", "text": "...", "timecode": "01:00:10:00",
//                  "end_timecode": "01:00:12:00", "is_reply": false}]}
#include "notemarker/notemarker.h"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

bool LoadBatch(const std::string& path, notemarker::CommentBatch* batch, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    *error = "cannot open " + path;
    return false;
  }
  const nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    *error = path + " is not a JSON object";
    return false;
  }
  if (doc.contains("frame_rate") && doc["frame_rate"].is_string()) {
    batch->frame_rate = doc["frame_rate"].get<std::string>();
  }
  if (!doc.contains("comments") || !doc["comments"].is_array()) {
    *error = path + " has no comments array";
    return false;
  }
  for (const auto& entry : doc["comments"]) {
    notemarker::ReviewComment comment;
    comment.author = entry.value("author", "");
    comment.text = entry.value("text", "");
    comment.timecode = entry.value("timecode", "");
    if (entry.contains("end_timecode") && entry["end_timecode"].is_string()) {
      comment.end_timecode = entry["end_timecode"].get<std::string>();
    }
    comment.is_reply = entry.value("is_reply", false);
    batch->comments.push_back(comment);
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " comments.json [--track NAME] [--force]" << std::endl;
    return 2;
  }
  notemarker::MarkerOptions options;
  bool force = false;
  for (int i = 2; i < argc; ++i) {
    if (std::strcmp(argv[i], "--track") == 0 && i + 1 < argc) {
      options.track_name = argv[++i];
    } else if (std::strcmp(argv[i], "--force") == 0) {
      force = true;
    }
  }

  notemarker::CommentBatch batch;
  std::string load_error;
  if (!LoadBatch(argv[1], &batch, &load_error)) {
    std::cerr << load_error << std::endl;
    return 1;
  }

  notemarker::Client client{notemarker::Config{}};
  notemarker::ClassifiedError error;
  if (!client.ConnectAndRegister(nullptr, &error)) {
    std::cerr << notemarker::FormatError(error) << std::endl;
    std::cerr << error.user_action << std::endl;
    return 1;
  }

  notemarker::CompatibilityReport report;
  if (!client.ValidateSessionCompatibility(&report, &batch, &error)) {
    std::cerr << notemarker::FormatError(error) << std::endl;
    client.Disconnect();
    return 1;
  }
  for (const auto& issue : report.errors) {
    std::cerr << "error: " << issue.message << " - " << issue.resolution << std::endl;
  }
  for (const auto& issue : report.warnings) {
    std::cerr << "warning: " << issue.message << std::endl;
  }
  if (!report.marker_creation_ready && !force) {
    std::cerr << report.summary.status_message << " (use --force to import anyway)" << std::endl;
    client.Disconnect();
    return 1;
  }

  const auto markers = notemarker::MarkersFromBatch(batch, options);
  std::cout << std::fixed << std::setprecision(0);
  const auto result = client.CreateMarkers(markers, [](const notemarker::BatchProgress& p) {
    std::cout << "\r[" << std::setw(3) << p.percentage << "%] " << p.current << "/" << p.total
              << " " << p.marker_name << std::flush;
  });
  std::cout << std::endl;

  if (result.error) {
    std::cerr << notemarker::FormatError(*result.error) << std::endl;
  }
  for (const auto& item : result.items) {
    if (!item.success && item.error) {
      std::cerr << "marker " << item.index + 1 << " \"" << item.name
                << "\": " << notemarker::FormatError(*item.error) << std::endl;
    }
  }
  if (result.timing_changed) {
    std::cerr << "session timing changed during import; later markers were rechecked"
              << std::endl;
  }
  std::cout << result.succeeded << " of " << result.total << " markers created" << std::endl;
  client.Disconnect();
  return result.failed == 0 ? 0 : 1;
}
