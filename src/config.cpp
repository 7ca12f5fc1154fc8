#include "heos/config.h"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace heos {

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (service_types.empty()) {
    return fail("service_types must not be empty");
  }
  for (const auto& type : service_types) {
    if (type.empty()) {
      return fail("service_types must not contain empty entries");
    }
  }
  if (cli_port == 0) {
    return fail("cli_port must be non-zero");
  }
  if (mdns_port == 0) {
    return fail("mdns_port must be non-zero");
  }
  if (discovery_timeout.count() <= 0) {
    return fail("discovery_timeout must be positive");
  }
  if (discovery_settle_delay.count() < 0 || discovery_settle_delay >= discovery_timeout) {
    return fail("discovery_settle_delay must be shorter than discovery_timeout");
  }
  if (resolve_timeout.count() <= 0) {
    return fail("resolve_timeout must be positive");
  }
  if (connect_timeout.count() <= 0) {
    return fail("connect_timeout must be positive");
  }
  if (connect_attempts <= 0) {
    return fail("connect_attempts must be positive");
  }
  if (connect_backoff.count() < 0) {
    return fail("connect_backoff must not be negative");
  }
  if (command_timeout.count() <= 0) {
    return fail("command_timeout must be positive");
  }
  if (command_retries < 0) {
    return fail("command_retries must not be negative");
  }
  if (command_retry_delay.count() < 0) {
    return fail("command_retry_delay must not be negative");
  }
  if (heartbeat_timeout.count() <= 0) {
    return fail("heartbeat_timeout must be positive");
  }
  if (reachability_timeout.count() <= 0) {
    return fail("reachability_timeout must be positive");
  }
  if (directory_ttl.count() <= 0) {
    return fail("directory_ttl must be positive");
  }
  if (keep_alive && (keep_alive_idle.count() <= 0 || keep_alive_interval.count() <= 0 ||
                     keep_alive_count <= 0)) {
    return fail("keep_alive_idle, keep_alive_interval and keep_alive_count must be positive");
  }
  if (mdns_query_interval.count() <= 0) {
    return fail("mdns_query_interval must be positive");
  }
  if (!is_valid_ipv4(mdns_group)) {
    return fail("mdns_group must be a valid IPv4 address");
  }
  if (!bind_address.empty() && !is_valid_ipv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  return true;
}

}  // namespace heos
