#include "notemarker/message_builder.h"

#include "logging.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace notemarker {
namespace {

using nlohmann::json;

// Invalid UTF-8 in caller text becomes U+FFFD instead of failing the dump.
std::string DumpBody(const json& body) {
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::atomic<uint64_t> g_task_counter{0};

uint32_t RandomSuffix() {
  thread_local std::mt19937 engine{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist(0, 0xffffff);
  return dist(engine);
}

bool Fail(ClassifiedError* error, const std::string& field, const std::string& message) {
  if (error) {
    *error = MakeError(ErrorType::kParsingError, message, {{"field", field}});
  }
  return false;
}

MemoryLocationReference ToLocationReference(TimeReference reference) {
  switch (reference) {
    case TimeReference::kAbsolute:
      return MemoryLocationReference::kAbsolute;
    case TimeReference::kBarBeat:
      return MemoryLocationReference::kBarBeat;
  }
  return MemoryLocationReference::kAbsolute;
}

// Parse a body, returning false for malformed or non-object JSON.
bool ParseBody(const std::string& body_json, json* out) {
  *out = json::parse(body_json, nullptr, false);
  return !out->is_discarded() && out->is_object();
}

}  // namespace

std::string GenerateTaskId(CommandId command) {
  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  const uint64_t counter = ++g_task_counter;
  std::ostringstream oss;
  oss << "notemarker_" << static_cast<int32_t>(command) << '_' << now << '_' << counter << '_'
      << std::hex << std::setw(6) << std::setfill('0') << RandomSuffix();
  return oss.str();
}

MessageBuilder::MessageBuilder(ProtocolVersion version, LogCallback log_callback)
    : version_(version),
      log_callback_(log_callback),
      converter_(SessionTiming{}, std::move(log_callback)) {}

void MessageBuilder::SetSessionTiming(const SessionTiming& timing) {
  converter_.SetSessionTiming(timing);
}

CommandEnvelope MessageBuilder::BuildCommand(CommandId command, const std::string& session_id,
                                             std::string body_json) const {
  CommandEnvelope envelope;
  envelope.task_id = GenerateTaskId(command);
  envelope.command = command;
  envelope.version = version_;
  envelope.session_id = session_id;
  envelope.body_json = std::move(body_json);
  detail::LogDebug(std::string("built ") + CommandIdName(command) + " task=" + envelope.task_id,
                   log_callback_);
  return envelope;
}

CommandEnvelope MessageBuilder::BuildRegisterConnection(
    const std::string& company_name, const std::string& application_name) const {
  json body = {
      {"company_name", company_name},
      {"application_name", application_name},
  };
  return BuildCommand(CommandId::kRegisterConnection, std::string(), DumpBody(body));
}

bool MessageBuilder::BuildCreateMemoryLocation(const MarkerSpec& marker,
                                               const std::string& session_id,
                                               CommandEnvelope* out,
                                               ClassifiedError* error) const {
  if (marker.name.empty()) {
    return Fail(error, "name", "marker name must not be empty");
  }
  const TimeValidation start = converter_.Validate(marker.start_time);
  if (!start.is_valid) {
    detail::LogWarn("invalid marker start time \"" + marker.start_time + "\": " + start.error,
                    log_callback_);
    return Fail(error, "start_time", "invalid start_time \"" + marker.start_time + "\": " +
                                         start.error);
  }
  if (marker.end_time) {
    const TimeValidation end = converter_.Validate(*marker.end_time);
    if (!end.is_valid) {
      detail::LogWarn("invalid marker end time \"" + *marker.end_time + "\": " + end.error,
                      log_callback_);
      return Fail(error, "end_time",
                  "invalid end_time \"" + *marker.end_time + "\": " + end.error);
    }
    int64_t start_samples = 0;
    int64_t end_samples = 0;
    // Ordering is only checkable when both ends map to samples.
    if (converter_.ToSamples(marker.start_time, &start_samples) &&
        converter_.ToSamples(*marker.end_time, &end_samples) && end_samples < start_samples) {
      return Fail(error, "end_time", "selection end_time precedes start_time");
    }
  }
  if (marker.color_index && *marker.color_index < 0) {
    return Fail(error, "color_index", "color_index must not be negative");
  }

  const MemoryLocationReference reference =
      marker.reference.value_or(ToLocationReference(converter_.ReferenceFor(marker.start_time)));
  const MarkerLocation location = marker.location.value_or(
      marker.track_name && !marker.track_name->empty() ? MarkerLocation::kNamedRuler
                                                       : MarkerLocation::kMainRuler);
  const TimeProperties properties =
      marker.end_time ? TimeProperties::kSelection : TimeProperties::kMarker;

  json body = {
      {"name", marker.name},
      {"start_time", marker.start_time},
      {"time_properties", WireName(properties)},
      {"reference", WireName(reference)},
      {"general_properties", json::object()},
      {"comments", marker.comments},
      {"color_index", marker.color_index.value_or(0)},
      {"location", WireName(location)},
  };
  if (marker.number && *marker.number >= 1) {
    body["number"] = *marker.number;
  }
  if (marker.track_name && !marker.track_name->empty()) {
    body["track_name"] = *marker.track_name;
  }
  if (marker.end_time) {
    body["end_time"] = *marker.end_time;
  }

  *out = BuildCommand(CommandId::kCreateMemoryLocation, session_id, DumpBody(body));
  return true;
}

bool MessageBuilder::BuildCreateNewTracks(const TrackSpec& tracks, const std::string& session_id,
                                          CommandEnvelope* out, ClassifiedError* error) const {
  if (tracks.number_of_tracks < 1) {
    return Fail(error, "numberOfTracks", "numberOfTracks must be at least 1");
  }
  json body = {
      {"numberOfTracks", tracks.number_of_tracks},
      {"trackType", WireName(tracks.type)},
      {"trackFormat", WireName(tracks.format)},
  };
  if (!tracks.name.empty()) {
    body["trackName"] = tracks.name;
  }
  *out = BuildCommand(CommandId::kCreateNewTracks, session_id, DumpBody(body));
  return true;
}

bool MessageBuilder::ValidateEnvelope(const CommandEnvelope& envelope, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (envelope.task_id.empty()) {
    return fail("missing task id");
  }
  const bool registration = envelope.command == CommandId::kRegisterConnection;
  if (registration && !envelope.session_id.empty()) {
    return fail("RegisterConnection must not carry a session id");
  }
  if (!registration && envelope.session_id.empty()) {
    return fail(std::string(CommandIdName(envelope.command)) + " requires a session id");
  }

  json body;
  switch (envelope.command) {
    case CommandId::kRegisterConnection:
      if (!ParseBody(envelope.body_json, &body)) {
        return fail("RegisterConnection body is not a JSON object");
      }
      if (!body.contains("company_name") || !body["company_name"].is_string() ||
          body["company_name"].get<std::string>().empty()) {
        return fail("missing company_name in RegisterConnection body");
      }
      // The host decides whether an empty application name is acceptable.
      if (!body.contains("application_name") || !body["application_name"].is_string()) {
        return fail("missing application_name in RegisterConnection body");
      }
      break;
    case CommandId::kCreateMemoryLocation:
      if (!ParseBody(envelope.body_json, &body)) {
        return fail("CreateMemoryLocation body is not a JSON object");
      }
      if (!body.contains("name") || !body.contains("start_time")) {
        return fail("missing name or start_time in CreateMemoryLocation body");
      }
      break;
    case CommandId::kCreateNewTracks:
      if (!ParseBody(envelope.body_json, &body)) {
        return fail("CreateNewTracks body is not a JSON object");
      }
      if (!body.contains("numberOfTracks") || !body["numberOfTracks"].is_number_integer() ||
          body["numberOfTracks"].get<int>() < 1) {
        return fail("invalid numberOfTracks in CreateNewTracks body");
      }
      if (!body.contains("trackType") || !body.contains("trackFormat")) {
        return fail("missing trackType or trackFormat in CreateNewTracks body");
      }
      break;
    case CommandId::kGetTrackList:
    case CommandId::kGetSessionSampleRate:
    case CommandId::kGetSessionTimeCodeRate:
    case CommandId::kGetSessionName:
    case CommandId::kGetMemoryLocations:
    case CommandId::kHostReadyCheck:
      if (!envelope.body_json.empty() && !ParseBody(envelope.body_json, &body)) {
        return fail(std::string(CommandIdName(envelope.command)) + " body is not a JSON object");
      }
      break;
  }
  return true;
}

}  // namespace notemarker
