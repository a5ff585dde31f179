#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notemarker {

/**
 * Closed taxonomy of failures surfaced to callers.
 */
enum class ErrorType {
  kConnectionRefused,
  kProToolsNotRunning,
  kConnectionTimeout,
  kChannelFailure,
  kGrpcError,
  kSdkVersionMismatch,
  kHostNotReady,
  kPtslNotAvailable,
  kPtslDisabled,
  kSessionIdParseError,
  kUnsupportedCommand,
  kParsingError,
  kUnknownError,
};

/**
 * A failure mapped onto the taxonomy. Built once at the boundary where the
 * failure is observed and not modified afterwards.
 */
struct ClassifiedError {
  ErrorType type = ErrorType::kUnknownError;
  std::string message;
  /// Whether the same call may succeed if repeated later. Retrying is up to the caller.
  bool retryable = false;
  /// One-line remediation suitable for showing to a user.
  std::string user_action;
  std::map<std::string, std::string> context;
  std::chrono::system_clock::time_point timestamp;
};

/**
 * Transport-level failure as reported by the RPC layer. `code` uses the gRPC
 * status code numbering (OK = 0, DEADLINE_EXCEEDED = 4, UNAVAILABLE = 14, ...).
 */
struct TransportError {
  int code = 0;
  std::string message;
};

/**
 * One entry of the host's command-error vocabulary.
 */
struct CommandErrorInfo {
  /// Wire name without the "CEType_" prefix, e.g. "PT_HostNotReady".
  const char* name;
  /// Numeric value the host may send instead of the name.
  int number;
  ErrorType type;
};

/// The full command-error vocabulary known to the classifier.
const std::vector<CommandErrorInfo>& CommandErrorVocabulary();

/// Look up a command error by name ("CEType_" prefix optional) or decimal number.
std::optional<CommandErrorInfo> FindCommandError(const std::string& name_or_number);

/// Stable upper-case name of an error type ("PTSL_HOST_NOT_READY", ...).
const char* ErrorTypeName(ErrorType type);
bool IsRetryable(ErrorType type);
/// Remediation text for an error type; never empty.
const char* UserActionFor(ErrorType type);

/**
 * Create a classified error with retryability and remediation filled in from
 * the type, timestamped now.
 */
ClassifiedError MakeError(ErrorType type, std::string message,
                          std::map<std::string, std::string> context = {});

/**
 * Classify a transport failure by status code, then by message text.
 * Never fails: unrecognized input yields kGrpcError.
 */
ClassifiedError ClassifyTransportError(const TransportError& error);

/**
 * Classify a command-level failure returned inside a transport-successful
 * response.
 *
 * @param error_json The response's error payload, `{"errors":[{...}]}`. May be
 *                   empty or malformed.
 * @param status_name Name of the non-success completion status, used in the
 *                    message when no payload is present.
 *
 * Malformed JSON yields kParsingError; a missing or unknown error type yields
 * kUnknownError.
 */
ClassifiedError ClassifyCommandError(const std::string& error_json,
                                     const std::string& status_name = {});

/// Render "TYPE: message" for logs.
std::string FormatError(const ClassifiedError& error);

}  // namespace notemarker
