#include "notemarker/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace notemarker {
namespace {

using nlohmann::json;

constexpr int kGrpcDeadlineExceeded = 4;
constexpr int kGrpcPermissionDenied = 7;
constexpr int kGrpcUnimplemented = 12;
constexpr int kGrpcUnavailable = 14;

constexpr const char kCommandErrorPrefix[] = "CEType_";

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string DescribeJsonValue(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

}  // namespace

const std::vector<CommandErrorInfo>& CommandErrorVocabulary() {
  static const std::vector<CommandErrorInfo> vocabulary = {
      {"PT_UnknownError", 0, ErrorType::kUnknownError},
      {"PT_NoOpenedSession", 1, ErrorType::kUnknownError},
      {"PT_UnsupportedCommand", 2, ErrorType::kUnsupportedCommand},
      {"PT_InvalidParameter", 3, ErrorType::kUnknownError},
      {"PT_HostNotReady", 4, ErrorType::kHostNotReady},
      {"SDK_VersionMismatch", 100, ErrorType::kSdkVersionMismatch},
      {"SDK_SessionIdParseError", 101, ErrorType::kSessionIdParseError},
      {"OS_ProToolsIsNotAvailable", 200, ErrorType::kPtslNotAvailable},
  };
  return vocabulary;
}

std::optional<CommandErrorInfo> FindCommandError(const std::string& name_or_number) {
  std::string name = name_or_number;
  if (name.rfind(kCommandErrorPrefix, 0) == 0) {
    name = name.substr(sizeof(kCommandErrorPrefix) - 1);
  }
  int number = 0;
  const char* first = name.data();
  const char* last = name.data() + name.size();
  const auto parsed = std::from_chars(first, last, number);
  const bool numeric = !name.empty() && parsed.ec == std::errc() && parsed.ptr == last;
  for (const auto& entry : CommandErrorVocabulary()) {
    if (numeric ? entry.number == number : name == entry.name) {
      return entry;
    }
  }
  return std::nullopt;
}

const char* ErrorTypeName(ErrorType type) {
  switch (type) {
    case ErrorType::kConnectionRefused:
      return "CONNECTION_REFUSED";
    case ErrorType::kProToolsNotRunning:
      return "PRO_TOOLS_NOT_RUNNING";
    case ErrorType::kConnectionTimeout:
      return "CONNECTION_TIMEOUT";
    case ErrorType::kChannelFailure:
      return "CHANNEL_FAILURE";
    case ErrorType::kGrpcError:
      return "GRPC_ERROR";
    case ErrorType::kSdkVersionMismatch:
      return "SDK_VERSION_MISMATCH";
    case ErrorType::kHostNotReady:
      return "PTSL_HOST_NOT_READY";
    case ErrorType::kPtslNotAvailable:
      return "PTSL_NOT_AVAILABLE";
    case ErrorType::kPtslDisabled:
      return "PTSL_DISABLED";
    case ErrorType::kSessionIdParseError:
      return "SESSION_ID_PARSE_ERROR";
    case ErrorType::kUnsupportedCommand:
      return "UNSUPPORTED_COMMAND";
    case ErrorType::kParsingError:
      return "PARSING_ERROR";
    case ErrorType::kUnknownError:
      return "UNKNOWN_ERROR";
  }
  return "UNKNOWN_ERROR";
}

bool IsRetryable(ErrorType type) {
  switch (type) {
    case ErrorType::kConnectionRefused:
    case ErrorType::kProToolsNotRunning:
    case ErrorType::kConnectionTimeout:
    case ErrorType::kHostNotReady:
    case ErrorType::kPtslNotAvailable:
    case ErrorType::kPtslDisabled:
      return true;
    case ErrorType::kChannelFailure:
    case ErrorType::kGrpcError:
    case ErrorType::kSdkVersionMismatch:
    case ErrorType::kSessionIdParseError:
    case ErrorType::kUnsupportedCommand:
    case ErrorType::kParsingError:
    case ErrorType::kUnknownError:
      return false;
  }
  return false;
}

const char* UserActionFor(ErrorType type) {
  switch (type) {
    case ErrorType::kConnectionRefused:
    case ErrorType::kProToolsNotRunning:
      return "Start Pro Tools and try again";
    case ErrorType::kConnectionTimeout:
      return "Check that Pro Tools is responsive, then try again";
    case ErrorType::kChannelFailure:
    case ErrorType::kGrpcError:
      return "Check the PTSL service and network connection";
    case ErrorType::kSdkVersionMismatch:
      return "Update Pro Tools or NoteMarker to compatible versions";
    case ErrorType::kHostNotReady:
      return "Wait for Pro Tools to fully load, then try again";
    case ErrorType::kPtslNotAvailable:
      return "Make sure Pro Tools is open and PTSL is available";
    case ErrorType::kPtslDisabled:
      return "Enable PTSL in Pro Tools Preferences > MIDI > PTSL";
    case ErrorType::kSessionIdParseError:
      return "Reconnect to Pro Tools to obtain a new session";
    case ErrorType::kUnsupportedCommand:
      return "This feature is not supported by the running Pro Tools version";
    case ErrorType::kParsingError:
      return "Unexpected data from Pro Tools; please report this issue";
    case ErrorType::kUnknownError:
      return "Check Pro Tools and PTSL configuration";
  }
  return "Check Pro Tools and PTSL configuration";
}

ClassifiedError MakeError(ErrorType type, std::string message,
                          std::map<std::string, std::string> context) {
  ClassifiedError error;
  error.type = type;
  error.message = std::move(message);
  error.retryable = IsRetryable(type);
  error.user_action = UserActionFor(type);
  error.context = std::move(context);
  error.timestamp = std::chrono::system_clock::now();
  return error;
}

ClassifiedError ClassifyTransportError(const TransportError& error) {
  const std::string text = Lowercase(error.message);
  std::map<std::string, std::string> context = {
      {"grpc_code", std::to_string(error.code)},
  };
  if (!error.message.empty()) {
    context["grpc_message"] = error.message;
  }
  const bool refused = Contains(text, "connection refused") || Contains(text, "econnrefused");

  switch (error.code) {
    case kGrpcUnavailable:
      if (refused) {
        return MakeError(ErrorType::kConnectionRefused,
                         "Connection refused - Pro Tools is not running or PTSL is disabled",
                         std::move(context));
      }
      return MakeError(ErrorType::kProToolsNotRunning,
                       "Pro Tools PTSL service is not available - ensure Pro Tools is running "
                       "with PTSL enabled",
                       std::move(context));
    case kGrpcDeadlineExceeded:
      return MakeError(ErrorType::kConnectionTimeout,
                       "Connection to Pro Tools PTSL service timed out", std::move(context));
    case kGrpcPermissionDenied:
      return MakeError(ErrorType::kPtslDisabled,
                       "PTSL access denied - ensure PTSL is enabled in Pro Tools preferences",
                       std::move(context));
    case kGrpcUnimplemented:
      return MakeError(ErrorType::kSdkVersionMismatch,
                       "PTSL method not implemented by host: " + error.message,
                       std::move(context));
    default:
      break;
  }
  if (refused) {
    return MakeError(ErrorType::kConnectionRefused,
                     "Connection refused - Pro Tools is not running or PTSL is disabled",
                     std::move(context));
  }
  if (Contains(text, "transient_failure") || Contains(text, "channel failed")) {
    return MakeError(ErrorType::kChannelFailure,
                     "gRPC channel failed - Pro Tools PTSL service is not responding",
                     std::move(context));
  }
  return MakeError(ErrorType::kGrpcError, "gRPC error: " + error.message, std::move(context));
}

ClassifiedError ClassifyCommandError(const std::string& error_json,
                                     const std::string& status_name) {
  if (error_json.empty()) {
    std::string message = "PTSL command failed";
    if (!status_name.empty()) {
      message += " with status " + status_name;
    }
    return MakeError(ErrorType::kUnknownError, message, {{"status", status_name}});
  }

  const json parsed = json::parse(error_json, nullptr, false);
  if (parsed.is_discarded()) {
    return MakeError(ErrorType::kParsingError, "malformed command error payload",
                     {{"payload", error_json}});
  }

  const json* first = nullptr;
  if (parsed.is_object()) {
    const auto it = parsed.find("errors");
    if (it != parsed.end() && it->is_array() && !it->empty()) {
      first = &(*it)[0];
    }
  }
  if (!first || !first->is_object()) {
    return MakeError(ErrorType::kUnknownError, "Unknown PTSL command error",
                     {{"payload", error_json}});
  }

  std::string detail = "Unknown error";
  const auto message_it = first->find("command_error_message");
  if (message_it != first->end() && message_it->is_string()) {
    detail = message_it->get<std::string>();
  }

  std::map<std::string, std::string> context = {{"payload", error_json}};
  std::optional<CommandErrorInfo> info;
  const auto type_it = first->find("command_error_type");
  if (type_it != first->end()) {
    const std::string raw_type = DescribeJsonValue(*type_it);
    context["command_error_type"] = raw_type;
    if (type_it->is_string() || type_it->is_number_integer()) {
      info = FindCommandError(raw_type);
    }
  }
  if (!status_name.empty()) {
    context["status"] = status_name;
  }
  if (!info) {
    return MakeError(ErrorType::kUnknownError, "PTSL command error: " + detail,
                     std::move(context));
  }

  std::string prefix;
  switch (info->type) {
    case ErrorType::kSdkVersionMismatch:
      prefix = "PTSL version mismatch: ";
      break;
    case ErrorType::kHostNotReady:
      prefix = "Pro Tools not ready: ";
      break;
    case ErrorType::kPtslNotAvailable:
      prefix = "Pro Tools not available: ";
      break;
    case ErrorType::kSessionIdParseError:
      prefix = "Session ID parse error: ";
      break;
    case ErrorType::kUnsupportedCommand:
      prefix = "Unsupported command: ";
      break;
    default:
      prefix = "PTSL command error: ";
      break;
  }
  return MakeError(info->type, prefix + detail, std::move(context));
}

std::string FormatError(const ClassifiedError& error) {
  std::ostringstream oss;
  oss << ErrorTypeName(error.type) << ": " << error.message;
  return oss.str();
}

}  // namespace notemarker
