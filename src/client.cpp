#include "notemarker/client.h"

#include "logging.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace notemarker {
namespace {

using nlohmann::json;
using detail::LogLevel;

constexpr int kGrpcUnknown = 2;

std::string Millis(std::chrono::milliseconds value) {
  return std::to_string(value.count()) + " ms";
}

// Parse a response body; an empty body is an empty object.
bool ParseResponseBody(const CommandEnvelope& envelope, const CommandResponse& response,
                       json* out, ClassifiedError* error) {
  if (response.body_json.empty()) {
    *out = json::object();
    return true;
  }
  *out = json::parse(response.body_json, nullptr, false);
  if (out->is_discarded() || !out->is_object()) {
    *error = MakeError(ErrorType::kParsingError,
                       std::string(CommandIdName(envelope.command)) +
                           " response body is not a JSON object",
                       {{"command", CommandIdName(envelope.command)},
                        {"task_id", envelope.task_id},
                        {"body", response.body_json}});
    return false;
  }
  return true;
}

ClassifiedError MissingField(CommandId command, const std::string& field) {
  return MakeError(ErrorType::kParsingError,
                   std::string(CommandIdName(command)) + " response has no " + field,
                   {{"command", CommandIdName(command)}, {"field", field}});
}

bool ExtractString(const json& body, CommandId command, const char* field, std::string* out,
                   ClassifiedError* error) {
  const auto it = body.find(field);
  if (it == body.end() || !it->is_string()) {
    *error = MissingField(command, field);
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

bool ExtractSampleRateSymbol(const json& body, std::string* symbol, ClassifiedError* error) {
  const auto it = body.find("sample_rate");
  if (it != body.end() && it->is_string()) {
    *symbol = it->get<std::string>();
    return true;
  }
  if (it != body.end() && it->is_number_integer()) {
    *symbol = SampleRateSymbol(it->get<int>());
    return true;
  }
  *error = MissingField(CommandId::kGetSessionSampleRate, "sample_rate");
  return false;
}

bool ExtractTimecodeRate(const json& body, std::string* current,
                         std::vector<std::string>* possible, ClassifiedError* error) {
  if (!ExtractString(body, CommandId::kGetSessionTimeCodeRate, "current_setting", current,
                     error)) {
    return false;
  }
  possible->clear();
  const auto it = body.find("possible_settings");
  if (it != body.end() && it->is_array()) {
    for (const auto& entry : *it) {
      if (entry.is_string()) {
        possible->push_back(entry.get<std::string>());
      }
    }
  }
  return true;
}

std::string OptionalString(const json& object, const char* field) {
  const auto it = object.find(field);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

struct ClientMetricsAtomic {
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> commands_succeeded{0};
  std::atomic<uint64_t> transport_errors{0};
  std::atomic<uint64_t> command_errors{0};
  std::atomic<uint64_t> heartbeats_sent{0};
  std::atomic<uint64_t> heartbeat_failures{0};
  std::atomic<uint64_t> callback_exceptions{0};

  ClientMetrics Snapshot() const {
    ClientMetrics snapshot;
    snapshot.commands_sent = commands_sent.load();
    snapshot.commands_succeeded = commands_succeeded.load();
    snapshot.transport_errors = transport_errors.load();
    snapshot.command_errors = command_errors.load();
    snapshot.heartbeats_sent = heartbeats_sent.load();
    snapshot.heartbeat_failures = heartbeat_failures.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

}  // namespace

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (host.empty()) {
    return fail("host must not be empty");
  }
  if (port <= 0 || port > 65535) {
    return fail("port must be in 1..65535");
  }
  if (company_name.empty()) {
    return fail("company_name must not be empty");
  }
  if (protocol_version.major_version <= 0) {
    return fail("protocol_version major must be positive");
  }
  if (connect_timeout.count() <= 0 || command_timeout.count() <= 0 ||
      registration_timeout.count() <= 0 || session_query_timeout.count() <= 0 ||
      heartbeat_timeout.count() <= 0) {
    return fail("timeouts must be positive");
  }
  if (heartbeat_interval.count() < 0) {
    return fail("heartbeat_interval must not be negative");
  }
  if (max_heartbeat_failures <= 0) {
    return fail("max_heartbeat_failures must be positive");
  }
  if (keepalive_time.count() <= 0 || keepalive_timeout.count() <= 0) {
    return fail("keepalive_time and keepalive_timeout must be positive");
  }
  if (max_message_bytes <= 0) {
    return fail("max_message_bytes must be positive");
  }
  if (initial_reconnect_backoff.count() <= 0) {
    return fail("initial_reconnect_backoff must be positive");
  }
  if (max_reconnect_backoff < initial_reconnect_backoff) {
    return fail("max_reconnect_backoff must be >= initial_reconnect_backoff");
  }
  return true;
}

const char* ConnectionEventName(ConnectionEventType type) {
  switch (type) {
    case ConnectionEventType::kConnected:
      return "connected";
    case ConnectionEventType::kConnectionFailed:
      return "connection_failed";
    case ConnectionEventType::kRegistered:
      return "registered";
    case ConnectionEventType::kRegistrationFailed:
      return "registration_failed";
    case ConnectionEventType::kDisconnected:
      return "disconnected";
    case ConnectionEventType::kHeartbeatFailed:
      return "heartbeat_failed";
  }
  return "unknown";
}

struct Client::Impl {
#ifdef NOTEMARKER_TESTING
  friend void test::SetSessionTiming(Client& client, const SessionTiming& timing);
  friend uint64_t test::GetTimingGeneration(Client& client);
#endif

  Impl(Config config, TransportFactory factory)
      : config_(std::move(config)),
        factory_(std::move(factory)),
        builder_(config_.protocol_version, config_.log_callback) {}

  ~Impl() { Disconnect(); }

  const Config& config() const { return config_; }

  bool Connect(ClassifiedError* error) {
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      const ClassifiedError failure = MakeError(
          ErrorType::kUnknownError, "invalid configuration: " + config_error,
          {{"config", config_error}});
      Emit(ConnectionEventType::kConnectionFailed, {}, failure);
      return Fail(failure, error);
    }

    std::shared_ptr<Transport> previous;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (connected_ && transport_) {
        return true;
      }
      previous = std::move(transport_);
    }
    if (previous) {
      previous->Close();
    }

    const std::string address = config_.host + ":" + std::to_string(config_.port);
    Log(LogLevel::kInfo, "connecting to PTSL at " + address);

    std::unique_ptr<Transport> created = factory_ ? factory_(config_) : nullptr;
    if (!created) {
      return FailConnect(MakeError(ErrorType::kChannelFailure, "no transport available for " +
                                                                   address),
                         error);
    }
    std::string open_error;
    if (!created->Open(&open_error)) {
      return FailConnect(MakeError(ErrorType::kChannelFailure,
                                   "failed to open channel to " + address + ": " + open_error,
                                   {{"address", address}}),
                         error);
    }
    std::shared_ptr<Transport> transport(std::move(created));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      transport_ = transport;
      channel_closed_ = false;
    }

    ClassifiedError wait_error;
    if (!WaitForReady(*transport, address, &wait_error)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transport_ == transport) {
          transport_.reset();
          channel_closed_ = true;
        }
      }
      transport->Close();
      return FailConnect(wait_error, error);
    }

    // Disconnect() may have run while we were waiting.
    bool installed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (transport_ == transport) {
        connected_ = true;
        installed = true;
      }
    }
    if (!installed) {
      transport->Close();
      return FailConnect(MakeError(ErrorType::kChannelFailure,
                                   "disconnected while connecting to " + address),
                         error);
    }
    Log(LogLevel::kInfo, "connected to PTSL at " + address);
    Emit(ConnectionEventType::kConnected, {}, std::nullopt);
    return true;
  }

  bool WaitForReady(Transport& transport, const std::string& address, ClassifiedError* out) {
    const auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
    ChannelState state = transport.GetState(true);
    const bool cold = state == ChannelState::kIdle;
    bool transitioned = false;
    for (;;) {
      if (state == ChannelState::kReady && (transitioned || !cold)) {
        return true;
      }
      if (state == ChannelState::kTransientFailure || state == ChannelState::kShutdown) {
        *out = MakeError(ErrorType::kChannelFailure,
                         std::string("channel entered ") + ChannelStateName(state) +
                             " while connecting to " + address,
                         {{"address", address}, {"state", ChannelStateName(state)}});
        return false;
      }
      if (!transport.WaitForStateChange(state, deadline)) {
        *out = MakeError(ErrorType::kConnectionTimeout,
                         "timed out after " + Millis(config_.connect_timeout) +
                             " waiting for channel to " + address,
                         {{"address", address}, {"state", ChannelStateName(state)}});
        return false;
      }
      transitioned = true;
      state = transport.GetState(true);
    }
  }

  bool RegisterConnection(const std::string& company_name, const std::string& application_name,
                          std::string* session_id, ClassifiedError* error) {
    std::optional<Session> existing;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_) {
        existing = *session_;
      }
    }
    if (existing) {
      // One session per connection; a different identity needs a reconnect.
      if (existing->company_name != company_name ||
          existing->application_name != application_name) {
        return Fail(MakeError(ErrorType::kSessionIdParseError,
                              "already registered as " + existing->company_name + "/" +
                                  existing->application_name,
                              {{"session_id", existing->session_id}}),
                    error);
      }
      if (session_id) {
        *session_id = existing->session_id;
      }
      return true;
    }
    if (!IsConnected()) {
      return FailRegistration(MakeError(ErrorType::kChannelFailure, "not connected"), error);
    }

    const CommandEnvelope envelope =
        BuilderSnapshot().BuildRegisterConnection(company_name, application_name);
    CommandResponse response;
    ClassifiedError failure;
    json body;
    if (!Dispatch(envelope, config_.registration_timeout, &response, &failure) ||
        !ParseResponseBody(envelope, response, &body, &failure)) {
      return FailRegistration(failure, error);
    }
    const auto it = body.find("session_id");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
      return FailRegistration(
          MakeError(ErrorType::kSessionIdParseError, "RegisterConnection response has no session_id",
                    {{"body", response.body_json}}),
          error);
    }
    const std::string id = it->get<std::string>();

    bool installed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (connected_) {
        Session session;
        session.session_id = id;
        session.company_name = company_name;
        session.application_name = application_name;
        session.timing = builder_.session_timing();
        session_ = session;
        installed = true;
      }
    }
    if (!installed) {
      return FailRegistration(
          MakeError(ErrorType::kChannelFailure, "disconnected during registration"), error);
    }
    if (session_id) {
      *session_id = id;
    }
    Log(LogLevel::kInfo, "registered PTSL session " + id);
    Emit(ConnectionEventType::kRegistered, id, std::nullopt);
    StartHeartbeat();
    return true;
  }

  bool ConnectAndRegister(std::string* session_id, ClassifiedError* error) {
    if (!Connect(error)) {
      Disconnect();
      return false;
    }
    if (!RegisterConnection(config_.company_name, config_.application_name, session_id, error)) {
      Disconnect();
      return false;
    }
    return true;
  }

  void Disconnect() { Teardown(false); }

  // Close the channel and clear the session. The transport is closed before
  // the heartbeat is joined so an in-flight check is cancelled, not awaited.
  // The heartbeat thread cannot
  // join itself, so when it initiates teardown its thread object stays
  // behind to be joined by the next Disconnect or StartHeartbeat.
  void Teardown(bool from_heartbeat) {
    std::thread heartbeat;
    std::shared_ptr<Transport> transport;
    bool was_connected = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      heartbeat_stop_ = true;
      if (!from_heartbeat) {
        heartbeat = std::move(heartbeat_thread_);
      }
      transport = std::move(transport_);
      was_connected = connected_ || session_.has_value();
      connected_ = false;
      session_.reset();
      if (transport) {
        channel_closed_ = true;
      }
    }
    heartbeat_cv_.notify_all();
    if (transport) {
      transport->Close();
    }
    JoinOrDetach(&heartbeat);
    if (was_connected) {
      Log(LogLevel::kInfo, "disconnected from PTSL");
      Emit(ConnectionEventType::kDisconnected, {}, std::nullopt);
    }
  }

  bool SendCommand(CommandId command, const std::string& body_json, CommandResponse* response,
                   ClassifiedError* error, const CommandOptions& options) {
    std::string session_id;
    if (!RequireSession(&session_id, error)) {
      return false;
    }
    const CommandEnvelope envelope = BuilderSnapshot().BuildCommand(command, session_id, body_json);
    CommandResponse local;
    ClassifiedError failure;
    if (!Dispatch(envelope, options.timeout.value_or(config_.command_timeout), &local, &failure)) {
      return Fail(failure, error);
    }
    if (response) {
      *response = std::move(local);
    }
    return true;
  }

  bool SendStreamingCommand(CommandId command, const std::string& body_json,
                            const ResponseCallback& on_response, CommandResponse* final_response,
                            ClassifiedError* error, const CommandOptions& options) {
    std::string session_id;
    if (!RequireSession(&session_id, error)) {
      return false;
    }
    const CommandEnvelope envelope = BuilderSnapshot().BuildCommand(command, session_id, body_json);
    std::string invalid;
    if (!MessageBuilder::ValidateEnvelope(envelope, &invalid)) {
      return Fail(MakeError(ErrorType::kParsingError, "invalid request: " + invalid,
                            {{"command", CommandIdName(command)}}),
                  error);
    }
    std::shared_ptr<Transport> transport = CurrentTransport();
    if (!transport) {
      return Fail(MakeError(ErrorType::kChannelFailure, "not connected"), error);
    }
    ResponseCallback guarded = [this, &on_response](const CommandResponse& response) {
      if (!on_response) {
        return;
      }
      try {
        on_response(response);
      } catch (const std::exception& ex) {
        RecordCallbackException("ResponseCallback", ex.what());
      } catch (...) {
        RecordCallbackException("ResponseCallback", "unknown exception");
      }
    };
    metrics_.commands_sent++;
    Log(LogLevel::kDebug, std::string("streaming ") + CommandIdName(command) +
                              " task=" + envelope.task_id);
    const CallResult result = transport->SendStreamingCommand(
        envelope, options.timeout.value_or(config_.command_timeout), guarded);
    CommandResponse local;
    ClassifiedError failure;
    if (!FinishDispatch(envelope, result, &local, &failure)) {
      return Fail(failure, error);
    }
    if (final_response) {
      *final_response = std::move(local);
    }
    return true;
  }

  bool GetSessionName(std::string* name, ClassifiedError* error) {
    json body;
    if (!Query(CommandId::kGetSessionName, config_.session_query_timeout, &body, error)) {
      return false;
    }
    ClassifiedError failure;
    if (!ExtractString(body, CommandId::kGetSessionName, "session_name", name, &failure)) {
      return Fail(failure, error);
    }
    return true;
  }

  bool GetSessionSampleRate(int* sample_rate, ClassifiedError* error) {
    json body;
    if (!Query(CommandId::kGetSessionSampleRate, config_.session_query_timeout, &body, error)) {
      return false;
    }
    ClassifiedError failure;
    std::string symbol;
    if (!ExtractSampleRateSymbol(body, &symbol, &failure)) {
      return Fail(failure, error);
    }
    const std::optional<int> parsed = ParseSampleRateSymbol(symbol);
    if (!parsed) {
      return Fail(MakeError(ErrorType::kParsingError, "unrecognized sample rate " + symbol,
                            {{"field", "sample_rate"}}),
                  error);
    }
    *sample_rate = *parsed;
    return true;
  }

  bool GetSessionTimeCodeRate(TimecodeRate* rate, std::vector<std::string>* possible,
                              ClassifiedError* error) {
    json body;
    if (!Query(CommandId::kGetSessionTimeCodeRate, config_.session_query_timeout, &body,
               error)) {
      return false;
    }
    ClassifiedError failure;
    std::string current;
    std::vector<std::string> settings;
    if (!ExtractTimecodeRate(body, &current, &settings, &failure)) {
      return Fail(failure, error);
    }
    const std::optional<TimecodeRate> parsed = ParseTimecodeRateSymbol(current);
    if (!parsed) {
      return Fail(MakeError(ErrorType::kParsingError, "unrecognized timecode rate " + current,
                            {{"field", "current_setting"}}),
                  error);
    }
    *rate = *parsed;
    if (possible) {
      *possible = std::move(settings);
    }
    return true;
  }

  bool GetSessionInfo(SessionInfo* info, ClassifiedError* error) {
    std::string session_id;
    if (!RequireSession(&session_id, error)) {
      return false;
    }
    const MessageBuilder builder = BuilderSnapshot();
    constexpr size_t kQueries = 3;
    const CommandId commands[kQueries] = {CommandId::kGetSessionName,
                                          CommandId::kGetSessionSampleRate,
                                          CommandId::kGetSessionTimeCodeRate};
    CommandEnvelope envelopes[kQueries];
    std::future<CallResult> pending[kQueries];
    std::optional<ClassifiedError> first_failure;

    // Issue all three before waiting on any.
    for (size_t i = 0; i < kQueries; ++i) {
      envelopes[i] = builder.BuildCommand(commands[i], session_id);
      ClassifiedError failure;
      pending[i] = BeginDispatch(envelopes[i], config_.session_query_timeout, &failure);
      if (!pending[i].valid() && !first_failure) {
        first_failure = failure;
      }
    }
    json bodies[kQueries];
    for (size_t i = 0; i < kQueries; ++i) {
      if (!pending[i].valid()) {
        continue;
      }
      CallResult result = Await(pending[i]);
      CommandResponse response;
      ClassifiedError failure;
      if (!FinishDispatch(envelopes[i], result, &response, &failure) ||
          !ParseResponseBody(envelopes[i], response, &bodies[i], &failure)) {
        if (!first_failure) {
          first_failure = failure;
        }
      }
    }
    if (first_failure) {
      return Fail(*first_failure, error);
    }

    SessionInfo combined;
    ClassifiedError failure;
    if (!ExtractString(bodies[0], CommandId::kGetSessionName, "session_name", &combined.name,
                       &failure) ||
        !ExtractSampleRateSymbol(bodies[1], &combined.sample_rate_symbol, &failure) ||
        !ExtractTimecodeRate(bodies[2], &combined.timecode_rate_symbol,
                             &combined.possible_timecode_rates, &failure)) {
      return Fail(failure, error);
    }
    combined.sample_rate = ParseSampleRateSymbol(combined.sample_rate_symbol);
    combined.timecode_rate = ParseTimecodeRateSymbol(combined.timecode_rate_symbol);
    if (combined.sample_rate && combined.timecode_rate) {
      SessionTiming timing;
      timing.sample_rate = *combined.sample_rate;
      timing.frame_rate = combined.timecode_rate->fps;
      ApplyTiming(timing);
    } else {
      Log(LogLevel::kWarn, "session timing not updated: unrecognized rate " +
                               combined.sample_rate_symbol + " / " +
                               combined.timecode_rate_symbol);
    }
    std::ostringstream oss;
    oss << "session \"" << combined.name << "\" " << combined.sample_rate_symbol << ' '
        << combined.timecode_rate_symbol;
    Log(LogLevel::kInfo, oss.str());
    *info = std::move(combined);
    return true;
  }

  bool ValidateSessionCompatibility(CompatibilityReport* report, const CommentBatch* batch,
                                    ClassifiedError* error) {
    SessionInfo info;
    if (!GetSessionInfo(&info, error)) {
      return false;
    }
    *report = BuildCompatibilityReport(info, batch, config_.log_callback);
    std::ostringstream oss;
    oss << "compatibility " << report->summary.status << ": " << report->errors.size()
        << " error(s), " << report->warnings.size() << " warning(s)";
    Log(report->marker_creation_ready ? LogLevel::kInfo : LogLevel::kWarn, oss.str());
    return true;
  }

  bool CreateMemoryLocation(const MarkerSpec& marker, ClassifiedError* error) {
    std::string session_id;
    if (!RequireSession(&session_id, error) || !EnsureTiming(error)) {
      return false;
    }
    CommandEnvelope envelope;
    ClassifiedError failure;
    CommandResponse response;
    if (!BuilderSnapshot().BuildCreateMemoryLocation(marker, session_id, &envelope, &failure) ||
        !Dispatch(envelope, config_.command_timeout, &response, &failure)) {
      return Fail(failure, error);
    }
    Log(LogLevel::kInfo, "created marker \"" + marker.name + "\" at " + marker.start_time);
    return true;
  }

  BatchResult CreateMarkers(const std::vector<MarkerSpec>& markers,
                            const ProgressCallback& progress) {
    BatchResult result;
    result.total = markers.size();
    std::string session_id;
    ClassifiedError failure;
    if (!RequireSession(&session_id, &failure) || !EnsureTiming(&failure)) {
      result.failed = result.total;
      result.error = failure;
      return result;
    }

    MessageBuilder builder = BuilderSnapshot();
    uint64_t generation = timing_generation_.load();
    bool revalidating = false;
    for (size_t i = 0; i < markers.size(); ++i) {
      const uint64_t current = timing_generation_.load();
      if (current != generation) {
        builder = BuilderSnapshot();
        generation = current;
        revalidating = true;
        result.timing_changed = true;
        Log(LogLevel::kWarn, "session timing changed during batch; revalidating " +
                                 std::to_string(markers.size() - i) + " remaining marker(s)");
      }

      const MarkerSpec& marker = markers[i];
      BatchItemResult item;
      item.index = i;
      item.name = marker.name;
      item.revalidated = revalidating;
      CommandEnvelope envelope;
      CommandResponse response;
      ClassifiedError item_error;
      if (builder.BuildCreateMemoryLocation(marker, session_id, &envelope, &item_error) &&
          Dispatch(envelope, config_.command_timeout, &response, &item_error)) {
        item.success = true;
        ++result.succeeded;
      } else {
        item.error = item_error;
        ++result.failed;
        RecordError(item_error);
      }
      result.items.push_back(std::move(item));

      if (progress) {
        BatchProgress update;
        update.current = i + 1;
        update.total = markers.size();
        update.percentage = 100.0 * static_cast<double>(i + 1) / static_cast<double>(markers.size());
        update.marker_name = marker.name;
        try {
          progress(update);
        } catch (const std::exception& ex) {
          RecordCallbackException("ProgressCallback", ex.what());
        } catch (...) {
          RecordCallbackException("ProgressCallback", "unknown exception");
        }
      }
    }
    std::ostringstream oss;
    oss << "marker batch finished: " << result.succeeded << " of " << result.total
        << " created";
    Log(result.failed == 0 ? LogLevel::kInfo : LogLevel::kWarn, oss.str());
    return result;
  }

  bool CreateNewTracks(const TrackSpec& tracks, ClassifiedError* error) {
    std::string session_id;
    if (!RequireSession(&session_id, error)) {
      return false;
    }
    CommandEnvelope envelope;
    ClassifiedError failure;
    CommandResponse response;
    if (!BuilderSnapshot().BuildCreateNewTracks(tracks, session_id, &envelope, &failure) ||
        !Dispatch(envelope, config_.command_timeout, &response, &failure)) {
      return Fail(failure, error);
    }
    return true;
  }

  bool GetMemoryLocations(std::vector<MemoryLocation>* locations, ClassifiedError* error) {
    json body;
    if (!Query(CommandId::kGetMemoryLocations, config_.session_query_timeout, &body, error)) {
      return false;
    }
    locations->clear();
    const auto it = body.find("memory_locations");
    if (it == body.end()) {
      return true;
    }
    if (!it->is_array()) {
      return Fail(MissingField(CommandId::kGetMemoryLocations, "memory_locations"), error);
    }
    for (const auto& entry : *it) {
      if (!entry.is_object()) {
        continue;
      }
      MemoryLocation location;
      const auto number = entry.find("number");
      if (number != entry.end() && number->is_number_integer()) {
        location.number = number->get<int>();
      }
      location.name = OptionalString(entry, "name");
      location.start_time = OptionalString(entry, "start_time");
      location.end_time = OptionalString(entry, "end_time");
      location.comments = OptionalString(entry, "comments");
      locations->push_back(std::move(location));
    }
    return true;
  }

  bool GetTrackList(std::vector<std::string>* track_names, ClassifiedError* error) {
    json body;
    if (!Query(CommandId::kGetTrackList, config_.session_query_timeout, &body, error)) {
      return false;
    }
    track_names->clear();
    const auto it = body.find("tracks");
    if (it == body.end()) {
      return true;
    }
    if (!it->is_array()) {
      return Fail(MissingField(CommandId::kGetTrackList, "tracks"), error);
    }
    for (const auto& entry : *it) {
      if (entry.is_string()) {
        track_names->push_back(entry.get<std::string>());
      } else if (entry.is_object()) {
        track_names->push_back(OptionalString(entry, "name"));
      }
    }
    return true;
  }

  bool HostReadyCheck(std::chrono::milliseconds timeout, ClassifiedError* error) {
    json body;
    return Query(CommandId::kHostReadyCheck, timeout, &body, error);
  }

  ChannelState GetChannelState() const {
    std::shared_ptr<Transport> transport = CurrentTransport();
    if (transport) {
      return transport->GetState(false);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_closed_ ? ChannelState::kShutdown : ChannelState::kIdle;
  }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }

  bool IsRegistered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value();
  }

  std::optional<Session> GetSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
  }

  std::optional<ClassifiedError> GetLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
  }

  ClientMetrics GetMetrics() const { return metrics_.Snapshot(); }

  void SetEventCallback(EventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_cb_ = std::move(cb);
  }

  // Record new session timing; bumps the generation only on change.
  void ApplyTiming(const SessionTiming& timing) {
    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!session_) {
        return;
      }
      if (!session_->timing_known || session_->timing != timing) {
        session_->timing = timing;
        session_->timing_known = true;
        builder_.SetSessionTiming(timing);
        ++timing_generation_;
        changed = true;
      }
    }
    if (changed) {
      std::ostringstream oss;
      oss << "session timing " << timing.sample_rate << " Hz, " << timing.frame_rate << " fps";
      Log(LogLevel::kDebug, oss.str());
    }
  }

 private:
  void Log(LogLevel level, const std::string& message) {
    if (!detail::Log(level, message, config_.log_callback)) {
      metrics_.callback_exceptions++;
    }
  }

  void RecordError(const ClassifiedError& failure) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = failure;
    }
    Log(LogLevel::kError, FormatError(failure));
  }

  bool Fail(const ClassifiedError& failure, ClassifiedError* out) {
    RecordError(failure);
    if (out) {
      *out = failure;
    }
    return false;
  }

  bool FailConnect(const ClassifiedError& failure, ClassifiedError* out) {
    Fail(failure, out);
    Emit(ConnectionEventType::kConnectionFailed, {}, failure);
    return false;
  }

  bool FailRegistration(const ClassifiedError& failure, ClassifiedError* out) {
    Fail(failure, out);
    Emit(ConnectionEventType::kRegistrationFailed, {}, failure);
    return false;
  }

  void RecordCallbackException(const char* name, const std::string& what) {
    metrics_.callback_exceptions++;
    Log(LogLevel::kError, std::string("callback threw exception: ") + name + ": " + what);
  }

  void Emit(ConnectionEventType type, const std::string& session_id,
            const std::optional<ClassifiedError>& failure) {
    EventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    ConnectionEvent event;
    event.type = type;
    event.session_id = session_id;
    event.error = failure;
    try {
      cb_copy(event);
    } catch (const std::exception& ex) {
      RecordCallbackException("EventCallback", ex.what());
    } catch (...) {
      RecordCallbackException("EventCallback", "unknown exception");
    }
  }

  std::shared_ptr<Transport> CurrentTransport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
  }

  MessageBuilder BuilderSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builder_;
  }

  bool RequireSession(std::string* session_id, ClassifiedError* error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_) {
        *session_id = session_->session_id;
        return true;
      }
    }
    return Fail(MakeError(ErrorType::kSessionIdParseError, "not registered"), error);
  }

  // Fetch session info once if the timing has never been read.
  bool EnsureTiming(ClassifiedError* error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_ && session_->timing_known) {
        return true;
      }
    }
    SessionInfo info;
    if (!GetSessionInfo(&info, error)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_ && session_->timing_known) {
        return true;
      }
    }
    return Fail(MakeError(ErrorType::kParsingError,
                          "session timing unavailable: unrecognized rate " +
                              info.sample_rate_symbol + " / " + info.timecode_rate_symbol,
                          {{"field", "timing"}}),
                error);
  }

  std::future<CallResult> BeginDispatch(const CommandEnvelope& envelope,
                                        std::chrono::milliseconds timeout,
                                        ClassifiedError* error) {
    std::string invalid;
    if (!MessageBuilder::ValidateEnvelope(envelope, &invalid)) {
      *error = MakeError(ErrorType::kParsingError, "invalid request: " + invalid,
                         {{"command", CommandIdName(envelope.command)}});
      return {};
    }
    std::shared_ptr<Transport> transport = CurrentTransport();
    if (!transport) {
      *error = MakeError(ErrorType::kChannelFailure, "not connected",
                         {{"command", CommandIdName(envelope.command)}});
      return {};
    }
    metrics_.commands_sent++;
    Log(LogLevel::kDebug, std::string("sending ") + CommandIdName(envelope.command) +
                              " task=" + envelope.task_id + " timeout=" + Millis(timeout));
    return transport->SendCommand(envelope, timeout);
  }

  CallResult Await(std::future<CallResult>& pending) {
    try {
      return pending.get();
    } catch (const std::exception& ex) {
      CallResult result;
      result.error.code = kGrpcUnknown;
      result.error.message = ex.what();
      return result;
    }
  }

  bool FinishDispatch(const CommandEnvelope& envelope, const CallResult& result,
                      CommandResponse* response, ClassifiedError* error) {
    if (!result.transport_ok) {
      metrics_.transport_errors++;
      *error = ClassifyTransportError(result.error);
    } else if (!result.response.succeeded()) {
      metrics_.command_errors++;
      *error = ClassifyCommandError(result.response.error_json,
                                    TaskStatusName(result.response.status));
    } else {
      metrics_.commands_succeeded++;
      *response = result.response;
      return true;
    }
    error->context["command"] = CommandIdName(envelope.command);
    error->context["task_id"] = envelope.task_id;
    return false;
  }

  bool Dispatch(const CommandEnvelope& envelope, std::chrono::milliseconds timeout,
                CommandResponse* response, ClassifiedError* error) {
    std::future<CallResult> pending = BeginDispatch(envelope, timeout, error);
    if (!pending.valid()) {
      return false;
    }
    return FinishDispatch(envelope, Await(pending), response, error);
  }

  bool Query(CommandId command, std::chrono::milliseconds timeout, json* body,
             ClassifiedError* error) {
    std::string session_id;
    if (!RequireSession(&session_id, error)) {
      return false;
    }
    const CommandEnvelope envelope = BuilderSnapshot().BuildCommand(command, session_id);
    CommandResponse response;
    ClassifiedError failure;
    if (!Dispatch(envelope, timeout, &response, &failure) ||
        !ParseResponseBody(envelope, response, body, &failure)) {
      return Fail(failure, error);
    }
    return true;
  }

  void StartHeartbeat() {
    if (config_.heartbeat_interval.count() <= 0) {
      return;
    }
    std::thread previous;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      previous = std::move(heartbeat_thread_);
      heartbeat_stop_ = true;
    }
    heartbeat_cv_.notify_all();
    JoinOrDetach(&previous);

    std::string start_error;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!session_) {
        return;
      }
      heartbeat_stop_ = false;
      try {
        heartbeat_thread_ = std::thread([this]() { HeartbeatLoop(); });
      } catch (const std::system_error& ex) {
        heartbeat_stop_ = true;
        start_error = ex.what();
      }
    }
    if (!start_error.empty()) {
      Log(LogLevel::kError, "heartbeat thread start failed: " + start_error);
    }
  }

  void HeartbeatLoop() {
    int failures = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!heartbeat_stop_) {
      if (heartbeat_cv_.wait_for(lock, config_.heartbeat_interval,
                                 [this]() { return heartbeat_stop_; })) {
        break;
      }
      lock.unlock();
      metrics_.heartbeats_sent++;
      ClassifiedError failure;
      const bool ok = HostReadyCheck(config_.heartbeat_timeout, &failure);
      lock.lock();
      if (heartbeat_stop_) {
        break;
      }
      if (ok) {
        failures = 0;
        continue;
      }
      ++failures;
      metrics_.heartbeat_failures++;
      if (failures < config_.max_heartbeat_failures) {
        lock.unlock();
        Log(LogLevel::kWarn, "heartbeat failed (" + std::to_string(failures) + "/" +
                                 std::to_string(config_.max_heartbeat_failures) + ")");
        lock.lock();
        continue;
      }
      lock.unlock();
      Log(LogLevel::kError, "heartbeat failed " + std::to_string(failures) +
                                " times, disconnecting");
      Emit(ConnectionEventType::kHeartbeatFailed, {}, failure);
      Teardown(true);
      return;
    }
  }

  static void JoinOrDetach(std::thread* thread) {
    if (!thread->joinable()) {
      return;
    }
    if (thread->get_id() == std::this_thread::get_id()) {
      thread->detach();
    } else {
      thread->join();
    }
  }

  Config config_;
  TransportFactory factory_;

  mutable std::mutex mutex_;
  std::shared_ptr<Transport> transport_;
  bool connected_ = false;
  bool channel_closed_ = false;
  std::optional<Session> session_;
  std::optional<ClassifiedError> last_error_;
  MessageBuilder builder_;
  std::atomic<uint64_t> timing_generation_{0};

  std::mutex callback_mutex_;
  EventCallback event_cb_;

  std::condition_variable heartbeat_cv_;
  bool heartbeat_stop_ = true;
  std::thread heartbeat_thread_;

  ClientMetricsAtomic metrics_;
};

Client::Client(Config config) : Client(std::move(config), MakeGrpcTransport) {}

Client::Client(Config config, TransportFactory factory)
    : impl_(new Impl(std::move(config), std::move(factory))) {}

Client::~Client() = default;

bool Client::Connect(ClassifiedError* error) { return impl_->Connect(error); }

bool Client::RegisterConnection(std::string* session_id, ClassifiedError* error) {
  return impl_->RegisterConnection(impl_->config().company_name,
                                   impl_->config().application_name, session_id, error);
}

bool Client::RegisterConnection(const std::string& company_name,
                                const std::string& application_name, std::string* session_id,
                                ClassifiedError* error) {
  return impl_->RegisterConnection(company_name, application_name, session_id, error);
}

bool Client::ConnectAndRegister(std::string* session_id, ClassifiedError* error) {
  return impl_->ConnectAndRegister(session_id, error);
}

void Client::Disconnect() { impl_->Disconnect(); }

bool Client::SendCommand(CommandId command, const std::string& body_json,
                         CommandResponse* response, ClassifiedError* error,
                         const CommandOptions& options) {
  return impl_->SendCommand(command, body_json, response, error, options);
}

bool Client::SendStreamingCommand(CommandId command, const std::string& body_json,
                                  const ResponseCallback& on_response,
                                  CommandResponse* final_response, ClassifiedError* error,
                                  const CommandOptions& options) {
  return impl_->SendStreamingCommand(command, body_json, on_response, final_response, error,
                                     options);
}

bool Client::GetSessionName(std::string* name, ClassifiedError* error) {
  return impl_->GetSessionName(name, error);
}

bool Client::GetSessionSampleRate(int* sample_rate, ClassifiedError* error) {
  return impl_->GetSessionSampleRate(sample_rate, error);
}

bool Client::GetSessionTimeCodeRate(TimecodeRate* rate, std::vector<std::string>* possible,
                                    ClassifiedError* error) {
  return impl_->GetSessionTimeCodeRate(rate, possible, error);
}

bool Client::GetSessionInfo(SessionInfo* info, ClassifiedError* error) {
  return impl_->GetSessionInfo(info, error);
}

bool Client::ValidateSessionCompatibility(CompatibilityReport* report, const CommentBatch* batch,
                                          ClassifiedError* error) {
  return impl_->ValidateSessionCompatibility(report, batch, error);
}

bool Client::CreateMemoryLocation(const MarkerSpec& marker, ClassifiedError* error) {
  return impl_->CreateMemoryLocation(marker, error);
}

BatchResult Client::CreateMarkers(const std::vector<MarkerSpec>& markers,
                                  const ProgressCallback& progress) {
  return impl_->CreateMarkers(markers, progress);
}

bool Client::CreateNewTracks(const TrackSpec& tracks, ClassifiedError* error) {
  return impl_->CreateNewTracks(tracks, error);
}

bool Client::GetMemoryLocations(std::vector<MemoryLocation>* locations, ClassifiedError* error) {
  return impl_->GetMemoryLocations(locations, error);
}

bool Client::GetTrackList(std::vector<std::string>* track_names, ClassifiedError* error) {
  return impl_->GetTrackList(track_names, error);
}

bool Client::HostReadyCheck(ClassifiedError* error) {
  return impl_->HostReadyCheck(impl_->config().session_query_timeout, error);
}

ChannelState Client::GetChannelState() const { return impl_->GetChannelState(); }

bool Client::IsConnected() const { return impl_->IsConnected(); }

bool Client::IsRegistered() const { return impl_->IsRegistered(); }

std::optional<Session> Client::GetSession() const { return impl_->GetSession(); }

std::optional<ClassifiedError> Client::GetLastError() const { return impl_->GetLastError(); }

ClientMetrics Client::GetMetrics() const { return impl_->GetMetrics(); }

void Client::SetEventCallback(EventCallback cb) { impl_->SetEventCallback(std::move(cb)); }

#ifdef NOTEMARKER_TESTING
namespace test {

void SetSessionTiming(Client& client, const SessionTiming& timing) {
  client.impl_->ApplyTiming(timing);
}

uint64_t GetTimingGeneration(Client& client) {
  return client.impl_->timing_generation_.load();
}

}  // namespace test
#endif

}  // namespace notemarker
