#include "log.h"

#include <iostream>

namespace heos {
namespace internal {

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

void Log(const Config& config, LogLevel level, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(config.log_level)) {
    return;
  }
  if (config.log_callback) {
    config.log_callback(level, message);
    return;
  }
  std::cerr << "[heos] " << LevelName(level) << ": " << message << std::endl;
}

bool Fail(Error* error, ErrorKind kind, const std::string& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
  return false;
}

std::string Describe(const Error& error) {
  std::string text = ToString(error.kind);
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

}  // namespace internal
}  // namespace heos
