#include "heos/types.h"

namespace heos {

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
    case ErrorKind::kConnectTimeout:
      return "connect_timeout";
    case ErrorKind::kConnectRefused:
      return "connect_refused";
    case ErrorKind::kConnectFailed:
      return "connect_failed";
    case ErrorKind::kReadTimeout:
      return "read_timeout";
    case ErrorKind::kConnectionLost:
      return "connection_lost";
    case ErrorKind::kProtocol:
      return "protocol_error";
    case ErrorKind::kCommandFailed:
      return "command_failed";
    case ErrorKind::kDeviceNotFound:
      return "device_not_found";
    case ErrorKind::kDiscoveryFailed:
      return "discovery_failed";
    case ErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

bool IsRetryable(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConnectTimeout:
    case ErrorKind::kConnectRefused:
    case ErrorKind::kConnectFailed:
    case ErrorKind::kReadTimeout:
    case ErrorKind::kConnectionLost:
      return true;
    default:
      return false;
  }
}

bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b) {
  return a.id == b.id && a.name == b.name && a.address == b.address &&
         a.port == b.port && a.model == b.model &&
         a.firmware_version == b.firmware_version &&
         a.network_id == b.network_id && a.serial == b.serial;
}

bool operator!=(const DeviceDescriptor& a, const DeviceDescriptor& b) {
  return !(a == b);
}

namespace {

nlohmann::json DescriptorToJson(const DeviceDescriptor& descriptor) {
  nlohmann::json out = nlohmann::json::object();
  out["id"] = descriptor.id;
  out["name"] = descriptor.name;
  out["ip"] = descriptor.address;
  out["port"] = descriptor.port;
  out["model"] = descriptor.model;
  out["version"] = descriptor.firmware_version;
  out["network"] = descriptor.network_id;
  out["serial"] = descriptor.serial;
  return out;
}

}  // namespace

nlohmann::json DeviceSnapshot::ToJson() const {
  nlohmann::json out = DescriptorToJson(descriptor);
  out["player"] = player;
  out["play_state"] = play_state;
  out["volume"] = volume.has_value() ? nlohmann::json(volume.value()) : nlohmann::json();
  out["mute"] = muted.has_value() ? nlohmann::json(muted.value()) : nlohmann::json();
  out["now_playing"] = now_playing;
  out["queue_head"] = queue_head;
  out["group"] = group;
  return out;
}

DiscoveryResult DiscoveryResult::Ok(DeviceSnapshot snapshot) {
  DiscoveryResult result;
  result.status = Status::kOk;
  result.snapshot = std::move(snapshot);
  return result;
}

DiscoveryResult DiscoveryResult::Failed(DeviceDescriptor descriptor,
                                        std::string message,
                                        ErrorKind kind) {
  DiscoveryResult result;
  result.status = Status::kFailed;
  result.error_kind = kind;
  result.snapshot.descriptor = std::move(descriptor);
  result.error = std::move(message);
  return result;
}

nlohmann::json DiscoveryResult::ToJson() const {
  nlohmann::json out = nlohmann::json::object();
  out["ip"] = snapshot.descriptor.address;
  if (ok()) {
    out["status"] = "connected";
    out["info"] = snapshot.ToJson();
  } else {
    out["status"] = "error";
    out["info"] = DescriptorToJson(snapshot.descriptor);
    out["error"] = error;
    out["kind"] = ToString(error_kind);
  }
  return out;
}

}  // namespace heos
