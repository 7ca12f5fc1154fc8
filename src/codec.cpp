#include "heos/codec.h"

#include "log.h"

#include <cctype>
#include <sstream>

namespace heos {
namespace {

using internal::Fail;

constexpr char kEventPrefix[] = "event/";
constexpr char kUnderProcess[] = "command under process";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

std::string StripTerminator(const std::string& line) {
  size_t end = line.size();
  while (end > 0 && (line[end - 1] == '\r' || line[end - 1] == '\n')) {
    --end;
  }
  return line.substr(0, end);
}

// Split "a=b&c" into pairs, unescaping both sides.
Params SplitPairs(const std::string& text) {
  Params out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('&', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    const std::string item = text.substr(start, end - start);
    if (!item.empty()) {
      const size_t eq = item.find('=');
      if (eq == std::string::npos) {
        out.emplace_back(UnescapeValue(item), "");
      } else {
        out.emplace_back(UnescapeValue(item.substr(0, eq)),
                         UnescapeValue(item.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return out;
}

}  // namespace

bool Response::IsEvent() const { return StartsWith(command, kEventPrefix); }

bool Response::IsUnderProcess() const {
  return message.find(kUnderProcess) != std::string::npos;
}

std::string EscapeValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '%':
        out += "%25";
        break;
      case '&':
        out += "%26";
        break;
      case '=':
        out += "%3D";
        break;
      default:
        out += c;
        break;
    }
  }
  return out;
}

std::string UnescapeValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = HexValue(value[i + 1]);
      const int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += value[i];
  }
  return out;
}

std::string EncodeCommand(const std::string& command, const Params& params) {
  std::ostringstream oss;
  oss << kCommandScheme << command;
  bool first = true;
  for (const auto& param : params) {
    oss << (first ? '?' : '&') << param.first << '=' << EscapeValue(param.second);
    first = false;
  }
  oss << kLineTerminator;
  return oss.str();
}

std::string EncodeCommand(const CommandRequest& request) {
  return EncodeCommand(request.command, request.params);
}

bool ValidateCommand(const std::string& command, Error* error) {
  if (command.empty()) {
    return Fail(error, ErrorKind::kInvalidArgument, "command is empty");
  }
  for (char c : command) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '?' || c == '&') {
      return Fail(error, ErrorKind::kInvalidArgument,
                  "command contains an invalid character: " + command);
    }
  }
  const size_t slash = command.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == command.size() ||
      command.find('/', slash + 1) != std::string::npos) {
    return Fail(error, ErrorKind::kInvalidArgument,
                "command must look like group/command: " + command);
  }
  return true;
}

bool ParseCommandLine(const std::string& line, CommandRequest* request) {
  const std::string text = StripTerminator(line);
  if (!StartsWith(text, kCommandScheme)) {
    return false;
  }
  const std::string rest = text.substr(sizeof(kCommandScheme) - 1);
  const size_t query = rest.find('?');
  CommandRequest parsed;
  parsed.command = rest.substr(0, query);
  if (!ValidateCommand(parsed.command)) {
    return false;
  }
  if (query != std::string::npos) {
    parsed.params = SplitPairs(rest.substr(query + 1));
  }
  if (request) {
    *request = std::move(parsed);
  }
  return true;
}

Params ParseMessageFields(const std::string& message) { return SplitPairs(message); }

std::optional<std::string> FindField(const Params& fields, const std::string& key) {
  for (const auto& field : fields) {
    if (field.first == key) {
      return field.second;
    }
  }
  return std::nullopt;
}

bool DecodeResponse(const std::string& line, Response* response, Error* error) {
  const std::string text = StripTerminator(line);
  if (text.empty()) {
    return Fail(error, ErrorKind::kProtocol, "empty response line");
  }
  const nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    return Fail(error, ErrorKind::kProtocol, "response is not valid JSON");
  }
  if (!root.is_object()) {
    return Fail(error, ErrorKind::kProtocol, "response is not a JSON object");
  }
  const auto heos = root.find("heos");
  if (heos == root.end() || !heos->is_object()) {
    return Fail(error, ErrorKind::kProtocol, "response has no heos object");
  }
  const auto command = heos->find("command");
  if (command == heos->end() || !command->is_string()) {
    return Fail(error, ErrorKind::kProtocol, "response has no heos.command");
  }
  const auto result = heos->find("result");
  const bool has_result = result != heos->end() && result->is_string();
  const bool event = StartsWith(command->get<std::string>(), kEventPrefix);
  if (!has_result && !event) {
    return Fail(error, ErrorKind::kProtocol, "response has no heos.result");
  }
  const auto message = heos->find("message");
  const bool has_message = message != heos->end() && !message->is_null();
  if (has_message && !message->is_string()) {
    return Fail(error, ErrorKind::kProtocol, "heos.message is not a string");
  }

  Response decoded;
  decoded.command = command->get<std::string>();
  decoded.raw_status = has_result ? result->get<std::string>() : std::string();
  decoded.ok = decoded.raw_status == "success";
  decoded.message = has_message ? message->get<std::string>() : std::string();
  decoded.message_fields = ParseMessageFields(decoded.message);
  const auto payload = root.find("payload");
  if (payload != root.end()) {
    decoded.payload = *payload;
  }
  const auto options = root.find("options");
  if (options != root.end()) {
    decoded.options = *options;
  }
  if (response) {
    *response = std::move(decoded);
  }
  return true;
}

}  // namespace heos
