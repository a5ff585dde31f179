#include "notemarker/client.h"
#include "notemarker/transport.h"

#include "logging.h"
#include "ptsl.pb.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/codegen/proto_utils.h>

#include <mutex>
#include <set>
#include <system_error>
#include <utility>

namespace notemarker {
namespace {

using PtslStub = grpc::TemplatedGenericStub<ptsl::Request, ptsl::Response>;

constexpr int kGrpcUnknown = 2;
constexpr int kGrpcUnavailable = 14;

ChannelState FromGrpcState(grpc_connectivity_state state) {
  switch (state) {
    case GRPC_CHANNEL_IDLE:
      return ChannelState::kIdle;
    case GRPC_CHANNEL_CONNECTING:
      return ChannelState::kConnecting;
    case GRPC_CHANNEL_READY:
      return ChannelState::kReady;
    case GRPC_CHANNEL_TRANSIENT_FAILURE:
      return ChannelState::kTransientFailure;
    case GRPC_CHANNEL_SHUTDOWN:
      return ChannelState::kShutdown;
  }
  return ChannelState::kShutdown;
}

grpc_connectivity_state ToGrpcState(ChannelState state) {
  switch (state) {
    case ChannelState::kIdle:
      return GRPC_CHANNEL_IDLE;
    case ChannelState::kConnecting:
      return GRPC_CHANNEL_CONNECTING;
    case ChannelState::kReady:
      return GRPC_CHANNEL_READY;
    case ChannelState::kTransientFailure:
      return GRPC_CHANNEL_TRANSIENT_FAILURE;
    case ChannelState::kShutdown:
      return GRPC_CHANNEL_SHUTDOWN;
  }
  return GRPC_CHANNEL_SHUTDOWN;
}

ptsl::Request ToProto(const CommandEnvelope& envelope) {
  ptsl::Request request;
  ptsl::RequestHeader* header = request.mutable_header();
  header->set_task_id(envelope.task_id);
  header->set_command(static_cast<int32_t>(envelope.command));
  header->set_version(envelope.version.major_version);
  header->set_version_minor(envelope.version.minor_version);
  header->set_version_revision(envelope.version.revision);
  header->set_session_id(envelope.session_id);
  request.set_request_body_json(envelope.body_json);
  return request;
}

CommandResponse FromProto(const ptsl::Response& response) {
  CommandResponse out;
  out.task_id = response.header().task_id();
  out.command = response.header().command();
  const int status = response.header().status();
  // Statuses outside the known set are treated as failures.
  out.status = ptsl::TaskStatus_IsValid(status) ? static_cast<TaskStatus>(status)
                                                : TaskStatus::kFailed;
  out.progress = response.header().progress();
  out.body_json = response.response_body_json();
  out.error_json = response.response_error_json();
  return out;
}

CallResult TransportFailure(int code, std::string message) {
  CallResult result;
  result.error.code = code;
  result.error.message = std::move(message);
  return result;
}

std::future<CallResult> ReadyFuture(CallResult result) {
  std::promise<CallResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

std::chrono::system_clock::time_point ToSystemDeadline(
    std::chrono::steady_clock::time_point deadline) {
  const auto remaining = deadline - std::chrono::steady_clock::now();
  return std::chrono::system_clock::now() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining);
}

// Contexts of calls in flight, so Close() can cancel them.
struct CallRegistry {
  std::mutex mutex;
  std::set<grpc::ClientContext*> active;
  bool closed = false;

  bool Add(grpc::ClientContext* context) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
      return false;
    }
    active.insert(context);
    return true;
  }

  void Remove(grpc::ClientContext* context) {
    std::lock_guard<std::mutex> lock(mutex);
    active.erase(context);
  }

  void CancelAll() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    for (grpc::ClientContext* context : active) {
      context->TryCancel();
    }
  }
};

// Wait for the next completion on a queue that has one operation pending.
bool Step(grpc::CompletionQueue* cq) {
  void* tag = nullptr;
  bool ok = false;
  if (!cq->Next(&tag, &ok)) {
    return false;
  }
  return ok;
}

void Drain(grpc::CompletionQueue* cq) {
  cq->Shutdown();
  void* tag = nullptr;
  bool ok = false;
  while (cq->Next(&tag, &ok)) {
  }
}

CallResult RunUnary(const std::shared_ptr<PtslStub>& stub,
                    const std::shared_ptr<CallRegistry>& registry, const ptsl::Request& request,
                    std::chrono::milliseconds timeout) {
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);
  if (!registry->Add(&context)) {
    return TransportFailure(kGrpcUnavailable, "channel closed");
  }

  grpc::CompletionQueue cq;
  ptsl::Response response;
  grpc::Status status;
  {
    std::unique_ptr<grpc::ClientAsyncResponseReader<ptsl::Response>> call =
        stub->PrepareUnaryCall(&context, kSendRequestMethod, request, &cq);
    call->StartCall();
    call->Finish(&response, &status, reinterpret_cast<void*>(1));
    Step(&cq);
  }
  registry->Remove(&context);
  Drain(&cq);

  if (!status.ok()) {
    return TransportFailure(static_cast<int>(status.error_code()), status.error_message());
  }
  CallResult result;
  result.transport_ok = true;
  result.response = FromProto(response);
  return result;
}

class GrpcTransport : public Transport {
 public:
  explicit GrpcTransport(const Config& config)
      : address_(config.host + ":" + std::to_string(config.port)),
        keepalive_time_(config.keepalive_time),
        keepalive_timeout_(config.keepalive_timeout),
        max_message_bytes_(config.max_message_bytes),
        initial_backoff_(config.initial_reconnect_backoff),
        max_backoff_(config.max_reconnect_backoff),
        log_callback_(config.log_callback),
        registry_(std::make_shared<CallRegistry>()) {}

  ~GrpcTransport() override { Close(); }

  bool Open(std::string* error) override {
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, static_cast<int>(keepalive_time_.count()));
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, static_cast<int>(keepalive_timeout_.count()));
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
    args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS,
                static_cast<int>(initial_backoff_.count()));
    args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, static_cast<int>(max_backoff_.count()));
    args.SetMaxReceiveMessageSize(max_message_bytes_);
    args.SetMaxSendMessageSize(max_message_bytes_);

    std::shared_ptr<grpc::Channel> channel =
        grpc::CreateCustomChannel(address_, grpc::InsecureChannelCredentials(), args);
    if (!channel) {
      if (error) {
        *error = "failed to create channel to " + address_;
      }
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = channel;
    stub_ = std::make_shared<PtslStub>(channel);
    detail::LogDebug("grpc channel created for " + address_, log_callback_);
    return true;
  }

  ChannelState GetState(bool try_to_connect) override {
    std::shared_ptr<grpc::Channel> channel = CurrentChannel();
    if (!channel) {
      return ChannelState::kShutdown;
    }
    return FromGrpcState(channel->GetState(try_to_connect));
  }

  bool WaitForStateChange(ChannelState last_observed,
                          std::chrono::steady_clock::time_point deadline) override {
    std::shared_ptr<grpc::Channel> channel = CurrentChannel();
    if (!channel) {
      // Closed: the state has moved to SHUTDOWN.
      return last_observed != ChannelState::kShutdown;
    }
    return channel->WaitForStateChange(ToGrpcState(last_observed), ToSystemDeadline(deadline));
  }

  std::future<CallResult> SendCommand(const CommandEnvelope& envelope,
                                      std::chrono::milliseconds timeout) override {
    std::shared_ptr<PtslStub> stub = CurrentStub();
    if (!stub) {
      return ReadyFuture(TransportFailure(kGrpcUnavailable, "channel closed"));
    }
    std::shared_ptr<CallRegistry> registry = registry_;
    ptsl::Request request = ToProto(envelope);
    try {
      return std::async(std::launch::async, [stub, registry, request, timeout]() {
        return RunUnary(stub, registry, request, timeout);
      });
    } catch (const std::system_error& ex) {
      return ReadyFuture(TransportFailure(kGrpcUnknown, std::string("call start failed: ") +
                                                            ex.what()));
    }
  }

  CallResult SendStreamingCommand(const CommandEnvelope& envelope,
                                  std::chrono::milliseconds timeout,
                                  const ResponseCallback& on_response) override {
    std::shared_ptr<PtslStub> stub = CurrentStub();
    if (!stub) {
      return TransportFailure(kGrpcUnavailable, "channel closed");
    }
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);
    if (!registry_->Add(&context)) {
      return TransportFailure(kGrpcUnavailable, "channel closed");
    }

    const ptsl::Request request = ToProto(envelope);
    void* const tag = reinterpret_cast<void*>(1);
    grpc::CompletionQueue cq;
    grpc::Status status;
    CommandResponse last;
    bool received = false;
    {
      auto stream = stub->PrepareCall(&context, kSendStreamingRequestMethod, &cq);
      stream->StartCall(tag);
      bool ok = Step(&cq);
      if (ok) {
        stream->Write(request, tag);
        ok = Step(&cq);
      }
      if (ok) {
        stream->WritesDone(tag);
        ok = Step(&cq);
      }
      ptsl::Response response;
      while (ok) {
        stream->Read(&response, tag);
        if (!Step(&cq)) {
          break;
        }
        last = FromProto(response);
        received = true;
        if (on_response) {
          on_response(last);
        }
      }
      stream->Finish(&status, tag);
      Step(&cq);
    }
    registry_->Remove(&context);
    Drain(&cq);

    if (!status.ok()) {
      return TransportFailure(static_cast<int>(status.error_code()), status.error_message());
    }
    if (!received) {
      return TransportFailure(kGrpcUnknown, "stream ended without a response");
    }
    CallResult result;
    result.transport_ok = true;
    result.response = std::move(last);
    return result;
  }

  void Close() override {
    registry_->CancelAll();
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel_) {
      detail::LogDebug("grpc channel to " + address_ + " closed", log_callback_);
    }
    stub_.reset();
    channel_.reset();
  }

 private:
  std::shared_ptr<grpc::Channel> CurrentChannel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
  }

  std::shared_ptr<PtslStub> CurrentStub() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stub_;
  }

  std::string address_;
  std::chrono::milliseconds keepalive_time_;
  std::chrono::milliseconds keepalive_timeout_;
  int max_message_bytes_;
  std::chrono::milliseconds initial_backoff_;
  std::chrono::milliseconds max_backoff_;
  LogCallback log_callback_;

  std::mutex mutex_;
  std::shared_ptr<grpc::Channel> channel_;
  std::shared_ptr<PtslStub> stub_;
  std::shared_ptr<CallRegistry> registry_;
};

}  // namespace

const char* ChannelStateName(ChannelState state) {
  switch (state) {
    case ChannelState::kIdle:
      return "IDLE";
    case ChannelState::kConnecting:
      return "CONNECTING";
    case ChannelState::kReady:
      return "READY";
    case ChannelState::kTransientFailure:
      return "TRANSIENT_FAILURE";
    case ChannelState::kShutdown:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

std::unique_ptr<Transport> MakeGrpcTransport(const Config& config) {
  return std::unique_ptr<Transport>(new GrpcTransport(config));
}

}  // namespace notemarker
