#pragma once

#include "notemarker/log.h"

#include <string>

namespace notemarker {
namespace detail {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

// Deliver a message to the callback, or stderr when none is set.
// Returns false if the callback threw.
bool Log(LogLevel level, const std::string& message, const LogCallback& callback);

inline void LogDebug(const std::string& message, const LogCallback& callback) {
  Log(LogLevel::kDebug, message, callback);
}
inline void LogInfo(const std::string& message, const LogCallback& callback) {
  Log(LogLevel::kInfo, message, callback);
}
inline void LogWarn(const std::string& message, const LogCallback& callback) {
  Log(LogLevel::kWarn, message, callback);
}
inline void LogError(const std::string& message, const LogCallback& callback) {
  Log(LogLevel::kError, message, callback);
}

}  // namespace detail
}  // namespace notemarker
