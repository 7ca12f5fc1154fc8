#pragma once

#include "heos/types.h"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace heos {

/**
 * One outgoing CLI command, e.g. {"player/get_volume", {{"pid", "42"}}}.
 */
struct CommandRequest {
  std::string command;
  Params params;
};

/**
 * Decoded device reply.
 */
struct Response {
  /// heos.result == "success".
  bool ok = false;
  /// heos.command echoed by the device.
  std::string command;
  /// heos.result as received.
  std::string raw_status;
  /// heos.message as received (may be empty).
  std::string message;
  /// heos.message split into unescaped key/value pairs.
  Params message_fields;
  /// Top-level "payload", null when absent.
  nlohmann::json payload;
  /// Top-level "options", null when absent.
  nlohmann::json options;

  /// Unsolicited change notification ("event/...").
  bool IsEvent() const;
  /// Interim reply sent before a slow command's final answer.
  bool IsUnderProcess() const;
};

/**
 * Render "heos://<command>[?k=v&k=v]\r\n" with escaped values.
 */
std::string EncodeCommand(const std::string& command, const Params& params);
std::string EncodeCommand(const CommandRequest& request);

/**
 * Check that a command is "group/command" shaped and carries no whitespace,
 * '?' or line terminators.
 */
bool ValidateCommand(const std::string& command, Error* error = nullptr);

/**
 * Parse an encoded command line (with or without the terminator).
 */
bool ParseCommandLine(const std::string& line, CommandRequest* request);

/**
 * Decode one JSON response line. Malformed input is a kProtocol error.
 */
bool DecodeResponse(const std::string& line, Response* response, Error* error = nullptr);

/**
 * Split "k=v&flag&k2=v2" into unescaped pairs; bare flags get an empty value.
 */
Params ParseMessageFields(const std::string& message);

std::optional<std::string> FindField(const Params& fields, const std::string& key);

/// Escape '%', '&' and '=' as the CLI expects.
std::string EscapeValue(const std::string& value);
std::string UnescapeValue(const std::string& value);

}  // namespace heos
