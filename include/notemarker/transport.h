#pragma once

#include "notemarker/errors.h"
#include "notemarker/protocol.h"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace notemarker {

struct Config;

/**
 * RPC channel connectivity state.
 *
 * IDLE -> CONNECTING -> READY; READY -> TRANSIENT_FAILURE and
 * TRANSIENT_FAILURE -> CONNECTING are recoverable; SHUTDOWN is terminal.
 */
enum class ChannelState {
  kIdle,
  kConnecting,
  kReady,
  kTransientFailure,
  kShutdown,
};

const char* ChannelStateName(ChannelState state);

/**
 * Outcome of one RPC. `transport_ok` false means the call itself failed and
 * `error` holds the status; otherwise `response` holds the (last) response,
 * which may still carry a non-success task status.
 */
struct CallResult {
  bool transport_ok = false;
  TransportError error;
  CommandResponse response;
};

/**
 * The RPC channel to the host. One instance owns one channel.
 *
 * Implementations must allow Close() while calls are in flight: pending calls
 * complete with a transport error.
 */
class Transport {
 public:
  using ResponseCallback = std::function<void(const CommandResponse&)>;

  virtual ~Transport() = default;

  /// Create the channel. Does not wait for it to become ready.
  virtual bool Open(std::string* error) = 0;

  /// Current connectivity state; `try_to_connect` starts a connection from IDLE.
  virtual ChannelState GetState(bool try_to_connect) = 0;

  /**
   * Block until the state differs from `last_observed` or the deadline
   * passes. Returns false on timeout.
   */
  virtual bool WaitForStateChange(ChannelState last_observed,
                                  std::chrono::steady_clock::time_point deadline) = 0;

  /// Start a unary call with its own deadline.
  virtual std::future<CallResult> SendCommand(const CommandEnvelope& envelope,
                                              std::chrono::milliseconds timeout) = 0;

  /**
   * Run a server-streaming call to completion, delivering each response to
   * `on_response` in arrival order. The returned result carries the last
   * response received.
   */
  virtual CallResult SendStreamingCommand(const CommandEnvelope& envelope,
                                          std::chrono::milliseconds timeout,
                                          const ResponseCallback& on_response) = 0;

  /// Cancel in-flight calls and release the channel. Idempotent.
  virtual void Close() = 0;
};

/**
 * gRPC transport: insecure channel to config.host:config.port with the
 * configured keepalive, message size and reconnect backoff arguments.
 */
std::unique_ptr<Transport> MakeGrpcTransport(const Config& config);

}  // namespace notemarker
