#include "logging.h"

#include <exception>
#include <iostream>

namespace notemarker {
namespace detail {
namespace {

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

}  // namespace

bool Log(LogLevel level, const std::string& message, const LogCallback& callback) {
  std::string line = "[";
  line += LevelTag(level);
  line += "] ";
  line += message;
  if (callback) {
    try {
      callback(line);
    } catch (const std::exception& ex) {
      std::cerr << "[notemarker] log callback threw: " << ex.what() << std::endl;
      return false;
    } catch (...) {
      std::cerr << "[notemarker] log callback threw a non-standard exception" << std::endl;
      return false;
    }
    return true;
  }
  if (level == LogLevel::kDebug) {
    return true;
  }
  std::cerr << "[notemarker] " << line << std::endl;
  return true;
}

}  // namespace detail
}  // namespace notemarker
