#pragma once

#include "heos/config.h"
#include "heos/types.h"

#include <string>

namespace heos {
namespace internal {

const char* LevelName(LogLevel level);

// Route a message to config.log_callback, or stderr when none is set.
void Log(const Config& config, LogLevel level, const std::string& message);

inline void LogDebug(const Config& config, const std::string& message) {
  Log(config, LogLevel::kDebug, message);
}

inline void LogInfo(const Config& config, const std::string& message) {
  Log(config, LogLevel::kInfo, message);
}

inline void LogWarning(const Config& config, const std::string& message) {
  Log(config, LogLevel::kWarning, message);
}

inline void LogError(const Config& config, const std::string& message) {
  Log(config, LogLevel::kError, message);
}

// Fill an optional error out-parameter; always returns false.
bool Fail(Error* error, ErrorKind kind, const std::string& message);

// "<kind>: <message>" for log lines.
std::string Describe(const Error& error);

}  // namespace internal
}  // namespace heos
