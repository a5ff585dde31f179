// Example: connect to Pro Tools and print the open session's properties.
#include "notemarker/notemarker.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  notemarker::Config config;
  if (argc > 1) {
    config.host = argv[1];
  }
  if (argc > 2) {
    config.port = std::stoi(argv[2]);
  }
  config.heartbeat_interval = std::chrono::milliseconds(0);

  notemarker::Client client(config);
  client.SetEventCallback([](const notemarker::ConnectionEvent& event) {
    std::cout << "event: " << notemarker::ConnectionEventName(event.type);
    if (!event.session_id.empty()) {
      std::cout << " session=" << event.session_id;
    }
    std::cout << std::endl;
  });

  notemarker::ClassifiedError error;
  if (!client.ConnectAndRegister(nullptr, &error)) {
    std::cerr << notemarker::FormatError(error) << std::endl;
    std::cerr << error.user_action << std::endl;
    return 1;
  }

  notemarker::CompatibilityReport report;
  if (!client.ValidateSessionCompatibility(&report, nullptr, &error)) {
    std::cerr << notemarker::FormatError(error) << std::endl;
    client.Disconnect();
    return 1;
  }

  const auto& summary = report.summary;
  std::cout << "Session:     " << summary.session_name << std::endl;
  std::cout << "Sample rate: " << summary.readable_sample_rate << std::endl;
  std::cout << "Frame rate:  " << summary.readable_frame_rate << std::endl;
  std::cout << "Status:      " << summary.status << " - " << summary.status_message << std::endl;
  for (const auto* list : {&report.errors, &report.warnings, &report.recommendations}) {
    for (const auto& issue : *list) {
      std::cout << "  " << issue.type << ": " << issue.message << " (" << issue.resolution << ")"
                << std::endl;
    }
  }

  std::vector<std::string> tracks;
  if (client.GetTrackList(&tracks, &error)) {
    std::cout << "Tracks:      " << tracks.size() << std::endl;
  }
  std::vector<notemarker::MemoryLocation> locations;
  if (client.GetMemoryLocations(&locations, &error)) {
    std::cout << "Markers:     " << locations.size() << std::endl;
  }

  client.Disconnect();
  return 0;
}
