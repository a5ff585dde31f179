#pragma once

#include "notemarker/errors.h"
#include "notemarker/log.h"
#include "notemarker/protocol.h"
#include "notemarker/time_format.h"

#include <optional>
#include <string>

namespace notemarker {

/**
 * One marker (or selection, when end_time is set) to create in the session.
 */
struct MarkerSpec {
  /// Marker name shown in the memory locations window.
  std::string name;
  /// Start position in any supported time format.
  std::string start_time;
  /// End position; makes the memory location a selection.
  std::optional<std::string> end_time;
  std::string comments;
  /// Host color palette index; omitted means 0.
  std::optional<int> color_index;
  std::optional<std::string> track_name;
  /// Defaults to kNamedRuler when track_name is set, kMainRuler otherwise.
  std::optional<MarkerLocation> location;
  /// Defaults to the reference implied by start_time's format.
  std::optional<MemoryLocationReference> reference;
  /// Explicit memory location slot; values below 1 let the host assign one.
  std::optional<int> number;
};

struct TrackSpec {
  int number_of_tracks = 1;
  TrackType type = TrackType::kAudio;
  TrackFormat format = TrackFormat::kMono;
  /// Optional; the host picks a default name when empty.
  std::string name;
};

/**
 * Generate a task id of the form notemarker_<command>_<ms>_<counter>_<hex>.
 * Unique for the lifetime of the process.
 */
std::string GenerateTaskId(CommandId command);

/**
 * Builds command envelopes for a session.
 *
 * Time-valued fields are validated against the builder's session timing
 * before an envelope is produced. The session id is passed into every call;
 * the builder keeps no connection state.
 */
class MessageBuilder {
 public:
  explicit MessageBuilder(ProtocolVersion version = {}, LogCallback log_callback = {});

  void SetSessionTiming(const SessionTiming& timing);
  const SessionTiming& session_timing() const { return converter_.timing(); }
  const TimeFormatConverter& converter() const { return converter_; }

  /// Envelope for a command whose body needs no validation.
  CommandEnvelope BuildCommand(CommandId command, const std::string& session_id,
                               std::string body_json = {}) const;

  /// RegisterConnection carries an empty session id.
  CommandEnvelope BuildRegisterConnection(const std::string& company_name,
                                          const std::string& application_name) const;

  /**
   * Build a CreateMemoryLocation envelope.
   *
   * Fails with kParsingError (context "field") if the name is empty, a time
   * does not validate for the session, or a selection ends before it starts.
   */
  bool BuildCreateMemoryLocation(const MarkerSpec& marker, const std::string& session_id,
                                 CommandEnvelope* out, ClassifiedError* error = nullptr) const;

  bool BuildCreateNewTracks(const TrackSpec& tracks, const std::string& session_id,
                            CommandEnvelope* out, ClassifiedError* error = nullptr) const;

  /**
   * Check header invariants and per-command body requirements before
   * dispatch: non-empty task id, session id empty exactly for
   * RegisterConnection, well-formed JSON bodies.
   */
  static bool ValidateEnvelope(const CommandEnvelope& envelope, std::string* error = nullptr);

 private:
  ProtocolVersion version_;
  LogCallback log_callback_;
  TimeFormatConverter converter_;
};

}  // namespace notemarker
