#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace heos {

/**
 * Well-known HEOS CLI TCP port.
 */
constexpr uint16_t kCliPort = 1255;

/**
 * mDNS defaults used by the service browser.
 */
constexpr uint16_t kMdnsPort = 5353;
constexpr char kMdnsGroup[] = "224.0.0.251";

/**
 * Service type advertised by HEOS players.
 */
constexpr char kServiceType[] = "_heos-audio._tcp.local.";

/**
 * CLI framing: every command and every response is one CRLF-terminated line.
 */
constexpr char kCommandScheme[] = "heos://";
constexpr char kLineTerminator[] = "\r\n";

/**
 * Liveness probe used by the session pool.
 */
constexpr char kHeartbeatCommand[] = "system/heart_beat";

/**
 * Ordered key/value parameters. Devices parse by key, so order is only kept
 * to make the wire form predictable.
 */
using Params = std::vector<std::pair<std::string, std::string>>;

enum class LogLevel {
  kDebug = 0,
  kInfo,
  kWarning,
  kError,
};

/**
 * Stable error categories for everything the core reports.
 */
enum class ErrorKind {
  kNone,
  kInvalidArgument,
  kConnectTimeout,
  kConnectRefused,
  kConnectFailed,
  kReadTimeout,
  kConnectionLost,
  kProtocol,
  kCommandFailed,
  kDeviceNotFound,
  kDiscoveryFailed,
  kCancelled,
};

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  /// Human-readable description, suitable for logging and API responses.
  std::string message;

  bool ok() const { return kind == ErrorKind::kNone; }
};

/// Stable lower_snake_case name for an error kind (e.g. "read_timeout").
const char* ToString(ErrorKind kind);

/// Transport-level kinds that a fresh connection may fix.
bool IsRetryable(ErrorKind kind);

/**
 * Identity and metadata for one physical device. Built once per discovery
 * round; a later round supersedes it with a new value.
 */
struct DeviceDescriptor {
  /// Player id (pid); empty until the first successful query.
  std::string id;
  /// Display name (mDNS instance label or the player's reported name).
  std::string name;
  /// IPv4 address, first non-link-local address resolved for the device.
  std::string address;
  /// CLI port.
  uint16_t port = kCliPort;
  std::string model;
  std::string firmware_version;
  std::string network_id;
  /// Device serial (TXT "did" or the player's reported serial).
  std::string serial;
};

bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b);
bool operator!=(const DeviceDescriptor& a, const DeviceDescriptor& b);

/**
 * One cached directory entry.
 */
struct DirectoryEntry {
  DeviceDescriptor descriptor;
  std::chrono::steady_clock::time_point discovered_at;
};

/**
 * Fuller device state collected by discovery enrichment.
 */
struct DeviceSnapshot {
  DeviceDescriptor descriptor;
  /// Player record from player/get_players.
  nlohmann::json player;
  /// "play", "pause" or "stop".
  std::string play_state;
  /// Volume level 0-100, if reported.
  std::optional<int> volume;
  /// Mute state, if reported.
  std::optional<bool> muted;
  /// Payload of player/get_now_playing_media.
  nlohmann::json now_playing;
  /// First queue entry, null when the queue is empty.
  nlohmann::json queue_head;
  /// Group containing this player, null when ungrouped.
  nlohmann::json group;

  /// Render as a JSON object for the API layer.
  nlohmann::json ToJson() const;
};

/**
 * Outcome of enriching one discovered device. A failed enrichment keeps the
 * base descriptor so the candidate is never dropped.
 */
struct DiscoveryResult {
  enum class Status {
    kOk,
    kFailed,
  };

  Status status = Status::kOk;
  /// Populated for kOk; for kFailed only snapshot.descriptor is meaningful.
  DeviceSnapshot snapshot;
  /// Failure description for kFailed.
  std::string error;
  /// Failure category for kFailed.
  ErrorKind error_kind = ErrorKind::kNone;

  static DiscoveryResult Ok(DeviceSnapshot snapshot);
  static DiscoveryResult Failed(DeviceDescriptor descriptor, std::string message,
                                ErrorKind kind = ErrorKind::kDiscoveryFailed);

  bool ok() const { return status == Status::kOk; }
  const DeviceDescriptor& descriptor() const { return snapshot.descriptor; }
  nlohmann::json ToJson() const;
};

/**
 * Counters for session pooling.
 */
struct PoolMetrics {
  uint64_t sessions_opened = 0;
  uint64_t sessions_reused = 0;
  uint64_t sessions_evicted = 0;
  uint64_t heartbeat_failures = 0;
};

/**
 * Counters for command dispatch.
 */
struct DispatchMetrics {
  uint64_t commands_sent = 0;
  uint64_t commands_failed = 0;
  uint64_t retries = 0;
  uint64_t history_callback_exceptions = 0;
};

struct ControllerMetrics {
  PoolMetrics pool;
  DispatchMetrics dispatch;
  uint64_t discoveries = 0;
  uint64_t directory_hits = 0;
};

}  // namespace heos
