#pragma once

#include "heos/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace heos {

/**
 * Controller configuration for discovery, sessions, timing and logging.
 */
struct Config {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  /// mDNS service types to browse for.
  std::vector<std::string> service_types = {kServiceType};
  /// CLI port used when a discovery record carries none.
  uint16_t cli_port = kCliPort;

  /// Overall budget for one discovery scan.
  std::chrono::milliseconds discovery_timeout{2000};
  /// Extra wait after the first announcement to catch near-simultaneous ones.
  std::chrono::milliseconds discovery_settle_delay{500};
  /// Per-instance budget for SRV/TXT/A resolution.
  std::chrono::milliseconds resolve_timeout{2000};
  /// Enrich discovered devices with player/queue/group queries.
  bool enrich_on_discovery = true;

  /// TCP connect budget per attempt.
  std::chrono::milliseconds connect_timeout{500};
  /// Connect attempts before giving up (includes the first one).
  int connect_attempts = 1;
  /// Backoff before the second connect attempt; doubles afterwards.
  std::chrono::milliseconds connect_backoff{250};

  /// Round-trip budget for one command.
  std::chrono::milliseconds command_timeout{500};
  /// Retries after a transport failure (0 disables retrying).
  int command_retries = 1;
  /// Delay between command retries.
  std::chrono::milliseconds command_retry_delay{250};

  /// Heartbeat budget when validating a pooled session.
  std::chrono::milliseconds heartbeat_timeout{2000};
  /// Connect budget for directory reachability probes.
  std::chrono::milliseconds reachability_timeout{1000};
  /// Directory lifetime before rediscovery.
  std::chrono::seconds directory_ttl{300};
  /// Probe cached devices before serving the directory.
  bool verify_directory = true;

  /// TCP keep-alive for CLI sessions.
  bool keep_alive = true;
  std::chrono::seconds keep_alive_idle{60};
  std::chrono::seconds keep_alive_interval{10};
  int keep_alive_count = 3;

  /// Destination for mDNS queries (multicast group or a unicast responder).
  std::string mdns_group = kMdnsGroup;
  uint16_t mdns_port = kMdnsPort;
  /// Local address for the mDNS socket and outgoing multicast interface.
  std::string bind_address = "0.0.0.0";
  /// Re-query interval while a browser is running.
  std::chrono::milliseconds mdns_query_interval{1000};

  /// Minimum level passed to the log sink.
  LogLevel log_level = LogLevel::kInfo;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

}  // namespace heos
