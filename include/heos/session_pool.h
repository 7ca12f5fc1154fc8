#pragma once

#include "heos/codec.h"
#include "heos/config.h"
#include "heos/transport.h"
#include "heos/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace heos {

class SessionPool;

#ifdef HEOS_TESTING
namespace test {
void SetDirectoryTimestamp(SessionPool& pool,
                           std::chrono::steady_clock::time_point when);
size_t GetDirectoryRecordCount(SessionPool& pool);
}  // namespace test
#endif

enum class SessionState {
  kDisconnected,
  kConnected,
};

/**
 * One persistent CLI connection to a device.
 *
 * A session is owned either by the pool or by the single caller that checked
 * it out; it is never shared. Destroying it closes the connection.
 */
class Session {
 public:
  Session(std::string address, uint16_t port, std::unique_ptr<Connection> connection);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& address() const { return address_; }
  uint16_t port() const { return port_; }
  SessionState state() const { return state_; }
  std::chrono::steady_clock::time_point last_validated_at() const {
    return last_validated_at_;
  }
  void MarkValidated(std::chrono::steady_clock::time_point when) {
    last_validated_at_ = when;
  }

  /**
   * Send a request and wait for its reply within timeout.
   *
   * Event lines, "command under process" interim replies and replies to other
   * commands are skipped. A device-level failure (result=fail) is still a
   * successful round trip; check Response::ok. Any transport or protocol
   * error closes the session.
   */
  bool RoundTrip(const CommandRequest& request,
                 std::chrono::milliseconds timeout,
                 Response* response,
                 Error* error);

  /// Idempotent.
  void Close();

 private:
  friend class SessionPool;

  std::string address_;
  uint16_t port_ = kCliPort;
  std::unique_ptr<Connection> connection_;
  SessionState state_ = SessionState::kDisconnected;
  std::chrono::steady_clock::time_point last_validated_at_;
  // Pool eviction epoch the session was checked out in.
  uint64_t epoch_ = 0;
};

/**
 * Per-device session cache plus the device directory.
 *
 * Holds at most one session per address. Map and directory mutations are
 * serialized by one pool-wide mutex; heartbeats and reachability probes run
 * outside it.
 *
 * Sessions checked out when UpdateDirectory, EvictAll or Shutdown runs are
 * closed when handed back instead of being stored.
 */
class SessionPool {
 public:
  using ReachabilityProbe = std::function<bool(const std::string& address,
                                               uint16_t port,
                                               std::chrono::milliseconds timeout)>;

  /**
   * @param connector Connection factory; defaults to TCP with the configured
   *        keep-alive.
   * @param probe Reachability probe; defaults to ProbeReachable.
   */
  explicit SessionPool(const Config& config,
                       Connector connector = {},
                       ReachabilityProbe probe = {});
  ~SessionPool();

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  /**
   * Check out the stored session for an address after a successful heartbeat.
   *
   * A failed heartbeat closes and removes the session.
   *
   * @return nullptr when no live session exists.
   */
  std::unique_ptr<Session> GetSession(const std::string& address);

  /**
   * Reuse a validated session, else connect a new one.
   *
   * A stored session for the address on a different port is closed first.
   * Fails with kCancelled after Shutdown.
   */
  std::unique_ptr<Session> EnsureSession(const std::string& address,
                                         uint16_t port,
                                         Error* error);

  /**
   * Hand a session (back) to the pool, closing any session already stored
   * for the same address. Sessions checked out before the last eviction, and
   * every session after Shutdown, are closed instead.
   */
  void StoreSession(std::unique_ptr<Session> session);

  /// Close and remove the session for an address.
  bool Evict(const std::string& address);
  /// Close and remove every session; returns how many were closed.
  size_t EvictAll();
  /// EvictAll, and refuse to pool or open sessions from now on. Idempotent.
  size_t Shutdown();

  size_t SessionCount() const;
  bool HasSession(const std::string& address) const;

  /**
   * Return the directory if it is fresh and (when verification is on) at
   * least one device is reachable. Unreachable devices are filtered out.
   *
   * @return nullopt when the directory is empty, expired or fully unreachable.
   */
  std::optional<std::vector<DeviceDescriptor>> GetDirectory();

  /**
   * Replace the directory and close every session.
   *
   * @return Number of sessions closed.
   */
  size_t UpdateDirectory(const std::vector<DeviceDescriptor>& descriptors);

  /**
   * Replace the entries whose address matches, keeping their timestamps and
   * every session, and re-sort the directory by name. Addresses not in the
   * directory are ignored.
   */
  void RefreshDescriptors(const std::vector<DeviceDescriptor>& descriptors);

  /// Last known descriptor for an address, regardless of age.
  std::optional<DeviceDescriptor> FindDevice(const std::string& address) const;

  /// Drop the directory; sessions are left alone.
  void InvalidateDirectory();

  PoolMetrics GetMetrics() const;
  const Config& config() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef HEOS_TESTING
  friend void test::SetDirectoryTimestamp(SessionPool& pool,
                                          std::chrono::steady_clock::time_point when);
  friend size_t test::GetDirectoryRecordCount(SessionPool& pool);
#endif
};

}  // namespace heos
