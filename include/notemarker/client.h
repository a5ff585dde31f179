#pragma once

#include "notemarker/comments.h"
#include "notemarker/compatibility.h"
#include "notemarker/errors.h"
#include "notemarker/log.h"
#include "notemarker/message_builder.h"
#include "notemarker/protocol.h"
#include "notemarker/time_format.h"
#include "notemarker/transport.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace notemarker {

class Client;

#ifdef NOTEMARKER_TESTING
namespace test {
void SetSessionTiming(Client& client, const SessionTiming& timing);
uint64_t GetTimingGeneration(Client& client);
}  // namespace test
#endif

/**
 * Client configuration: endpoint, identity, timeouts and channel tuning.
 */
struct Config {
  using LogCallback = notemarker::LogCallback;

  /// Host running Pro Tools.
  std::string host = kDefaultHost;
  /// PTSL gRPC port.
  int port = kDefaultPort;

  /// Company name sent with RegisterConnection.
  std::string company_name = "alternatone";
  /// Application name sent with RegisterConnection (may be empty).
  std::string application_name = "notemarker";
  /// Protocol version sent in every request header.
  ProtocolVersion protocol_version;

  /// Bounded wait for the channel to become ready.
  std::chrono::milliseconds connect_timeout{10000};
  /// Default per-call deadline for commands.
  std::chrono::milliseconds command_timeout{30000};
  /// Deadline for RegisterConnection.
  std::chrono::milliseconds registration_timeout{15000};
  /// Deadline for each session query.
  std::chrono::milliseconds session_query_timeout{10000};

  /// Interval between HostReadyCheck heartbeats; zero disables the heartbeat.
  std::chrono::milliseconds heartbeat_interval{30000};
  /// Deadline for each heartbeat.
  std::chrono::milliseconds heartbeat_timeout{5000};
  /// Consecutive heartbeat failures before the connection is torn down.
  int max_heartbeat_failures = 3;

  /// HTTP/2 keepalive ping interval.
  std::chrono::milliseconds keepalive_time{30000};
  /// Wait for a keepalive ping acknowledgement.
  std::chrono::milliseconds keepalive_timeout{5000};
  /// Maximum send/receive message size in bytes.
  int max_message_bytes = 4 * 1024 * 1024;
  /// Channel reconnect backoff bounds.
  std::chrono::milliseconds initial_reconnect_backoff{1000};
  std::chrono::milliseconds max_reconnect_backoff{30000};

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * A registered application session. Lives as long as the connection.
 */
struct Session {
  std::string session_id;
  std::string company_name;
  std::string application_name;
  /// Session timing; defaults until session info has been fetched.
  SessionTiming timing;
  bool timing_known = false;
};

enum class ConnectionEventType {
  kConnected,
  kConnectionFailed,
  kRegistered,
  kRegistrationFailed,
  kDisconnected,
  kHeartbeatFailed,
};

const char* ConnectionEventName(ConnectionEventType type);

/**
 * Connection lifecycle notification. Each transition is delivered once.
 */
struct ConnectionEvent {
  ConnectionEventType type = ConnectionEventType::kConnected;
  /// Set for kRegistered.
  std::string session_id;
  /// Set for the failure events.
  std::optional<ClassifiedError> error;
};

/**
 * Lightweight counters for command flow and error reporting.
 */
struct ClientMetrics {
  uint64_t commands_sent = 0;
  uint64_t commands_succeeded = 0;
  uint64_t transport_errors = 0;
  uint64_t command_errors = 0;
  uint64_t heartbeats_sent = 0;
  uint64_t heartbeat_failures = 0;
  uint64_t callback_exceptions = 0;
};

struct CommandOptions {
  /// Overrides Config::command_timeout for this call.
  std::optional<std::chrono::milliseconds> timeout;
};

/**
 * Progress after each completed marker of a batch.
 */
struct BatchProgress {
  size_t current = 0;
  size_t total = 0;
  double percentage = 0.0;
  std::string marker_name;
};

struct BatchItemResult {
  size_t index = 0;
  std::string name;
  bool success = false;
  /// Validated again after the session timing changed mid-batch.
  bool revalidated = false;
  std::optional<ClassifiedError> error;
};

struct BatchResult {
  size_t total = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  /// The session timing changed while the batch ran.
  bool timing_changed = false;
  std::vector<BatchItemResult> items;
  /// Set when the batch could not start (not registered, timing unavailable).
  std::optional<ClassifiedError> error;
};

/**
 * A memory location read back from the session.
 */
struct MemoryLocation {
  int number = 0;
  std::string name;
  std::string start_time;
  std::string end_time;
  std::string comments;
};

/**
 * PTSL client: channel lifecycle, registration, command dispatch and
 * marker creation for one Pro Tools instance.
 *
 * Operations report failures as a ClassifiedError through the optional
 * `error` out-parameter and GetLastError(). Nothing is retried internally.
 */
class Client {
 public:
  using EventCallback = std::function<void(const ConnectionEvent&)>;
  using ProgressCallback = std::function<void(const BatchProgress&)>;
  using ResponseCallback = Transport::ResponseCallback;
  using TransportFactory = std::function<std::unique_ptr<Transport>(const Config&)>;

  /// Construct a client that connects over gRPC.
  explicit Client(Config config);
  /// Construct a client whose channels come from `factory`.
  Client(Config config, TransportFactory factory);
  /// Disconnect and stop the heartbeat.
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * Open the channel and wait up to connect_timeout for it to become ready.
   * Does not register.
   */
  bool Connect(ClassifiedError* error = nullptr);

  /// Register with the configured company and application names.
  bool RegisterConnection(std::string* session_id = nullptr, ClassifiedError* error = nullptr);
  bool RegisterConnection(const std::string& company_name, const std::string& application_name,
                          std::string* session_id = nullptr, ClassifiedError* error = nullptr);

  /// Connect then register; on any failure the client is left disconnected.
  bool ConnectAndRegister(std::string* session_id = nullptr, ClassifiedError* error = nullptr);

  /// Close the channel and clear the session. Safe from any state.
  void Disconnect();

  /**
   * Send a command with a JSON body on the registered session.
   *
   * @param response Filled with the completed response on success.
   */
  bool SendCommand(CommandId command, const std::string& body_json, CommandResponse* response,
                   ClassifiedError* error = nullptr, const CommandOptions& options = {});

  /**
   * Send a server-streaming command. Every response is passed to
   * `on_response` in order; the last one decides success.
   */
  bool SendStreamingCommand(CommandId command, const std::string& body_json,
                            const ResponseCallback& on_response,
                            CommandResponse* final_response = nullptr,
                            ClassifiedError* error = nullptr,
                            const CommandOptions& options = {});

  bool GetSessionName(std::string* name, ClassifiedError* error = nullptr);
  bool GetSessionSampleRate(int* sample_rate, ClassifiedError* error = nullptr);
  bool GetSessionTimeCodeRate(TimecodeRate* rate, std::vector<std::string>* possible = nullptr,
                              ClassifiedError* error = nullptr);

  /**
   * Fetch name, sample rate and timecode rate as three concurrent calls and
   * combine them. Updates the session timing used for time conversion.
   */
  bool GetSessionInfo(SessionInfo* info, ClassifiedError* error = nullptr);

  /// Fetch session info and check it (and `batch`, if given) for marker creation.
  bool ValidateSessionCompatibility(CompatibilityReport* report,
                                    const CommentBatch* batch = nullptr,
                                    ClassifiedError* error = nullptr);

  bool CreateMemoryLocation(const MarkerSpec& marker, ClassifiedError* error = nullptr);

  /**
   * Create markers one after another. A failed marker does not stop the
   * batch. If the session timing changes mid-batch, the remaining markers
   * are validated against the new timing.
   */
  BatchResult CreateMarkers(const std::vector<MarkerSpec>& markers,
                            const ProgressCallback& progress = {});

  bool CreateNewTracks(const TrackSpec& tracks, ClassifiedError* error = nullptr);
  bool GetMemoryLocations(std::vector<MemoryLocation>* locations,
                          ClassifiedError* error = nullptr);
  bool GetTrackList(std::vector<std::string>* track_names, ClassifiedError* error = nullptr);
  bool HostReadyCheck(ClassifiedError* error = nullptr);

  ChannelState GetChannelState() const;
  bool IsConnected() const;
  bool IsRegistered() const;
  std::optional<Session> GetSession() const;
  /// Return the most recent classified error, if any.
  std::optional<ClassifiedError> GetLastError() const;
  ClientMetrics GetMetrics() const;

  /// Set callback invoked on connection lifecycle transitions.
  void SetEventCallback(EventCallback cb);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef NOTEMARKER_TESTING
  friend void test::SetSessionTiming(Client& client, const SessionTiming& timing);
  friend uint64_t test::GetTimingGeneration(Client& client);
#endif
};

}  // namespace notemarker
