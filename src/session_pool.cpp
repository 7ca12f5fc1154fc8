#include "heos/session_pool.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace heos {
namespace {

using internal::Fail;

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

KeepAliveOptions KeepAliveFromConfig(const Config& config) {
  KeepAliveOptions options;
  options.enabled = config.keep_alive;
  options.idle = config.keep_alive_idle;
  options.interval = config.keep_alive_interval;
  options.count = config.keep_alive_count;
  return options;
}

}  // namespace

Session::Session(std::string address, uint16_t port, std::unique_ptr<Connection> connection)
    : address_(std::move(address)),
      port_(port),
      connection_(std::move(connection)),
      last_validated_at_(std::chrono::steady_clock::now()) {
  if (connection_ && connection_->IsOpen()) {
    state_ = SessionState::kConnected;
  }
}

Session::~Session() { Close(); }

void Session::Close() {
  if (connection_) {
    connection_->Close();
  }
  state_ = SessionState::kDisconnected;
}

bool Session::RoundTrip(const CommandRequest& request,
                        std::chrono::milliseconds timeout,
                        Response* response,
                        Error* error) {
  if (!connection_ || state_ != SessionState::kConnected) {
    return Fail(error, ErrorKind::kConnectionLost, "session to " + address_ + " is closed");
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  if (!connection_->SendLine(EncodeCommand(request), timeout, error)) {
    Close();
    return false;
  }
  for (;;) {
    const auto left = Remaining(deadline);
    if (left.count() <= 0) {
      Close();
      return Fail(error, ErrorKind::kReadTimeout,
                  "timed out waiting for " + request.command + " from " + address_);
    }
    std::string line;
    if (!connection_->ReceiveLine(left, false, &line, error)) {
      Close();
      return false;
    }
    Response decoded;
    if (!DecodeResponse(line, &decoded, error)) {
      Close();
      return false;
    }
    // Unsolicited events, interim replies and leftovers from an earlier
    // timed-out exchange.
    if (decoded.IsEvent() || decoded.IsUnderProcess() ||
        decoded.command != request.command) {
      continue;
    }
    if (response) {
      *response = std::move(decoded);
    }
    return true;
  }
}

struct SessionPool::Impl {
  struct Metrics {
    std::atomic<uint64_t> sessions_opened{0};
    std::atomic<uint64_t> sessions_reused{0};
    std::atomic<uint64_t> sessions_evicted{0};
    std::atomic<uint64_t> heartbeat_failures{0};
  };

  Impl(const Config& cfg, Connector conn, ReachabilityProbe reach)
      : config(cfg), connector(std::move(conn)), probe(std::move(reach)) {
    if (!connector) {
      connector = MakeTcpConnector(KeepAliveFromConfig(config));
    }
    if (!probe) {
      probe = ProbeReachable;
    }
  }

  // Removes every session under the lock and retires the checked-out ones;
  // callers destroy the returned sessions unlocked.
  std::vector<std::unique_ptr<Session>> TakeAllLocked() {
    ++epoch;
    std::vector<std::unique_ptr<Session>> taken;
    taken.reserve(sessions.size());
    for (auto& entry : sessions) {
      taken.push_back(std::move(entry.second));
    }
    sessions.clear();
    return taken;
  }

  bool ExpiredLocked(std::chrono::steady_clock::time_point now) const {
    return directory.empty() || now - discovered_at >= config.directory_ttl;
  }

  Config config;
  Connector connector;
  ReachabilityProbe probe;

  mutable std::mutex mutex;
  std::unordered_map<std::string, std::unique_ptr<Session>> sessions;
  std::vector<DirectoryEntry> directory;
  std::chrono::steady_clock::time_point discovered_at;
  uint64_t generation = 0;
  // Bumped by every pool-wide eviction.
  uint64_t epoch = 0;
  bool shut_down = false;

  Metrics metrics;
};

SessionPool::SessionPool(const Config& config, Connector connector, ReachabilityProbe probe)
    : impl_(new Impl(config, std::move(connector), std::move(probe))) {}

SessionPool::~SessionPool() { EvictAll(); }

std::unique_ptr<Session> SessionPool::GetSession(const std::string& address) {
  std::unique_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->sessions.find(address);
    if (it == impl_->sessions.end()) {
      return nullptr;
    }
    session = std::move(it->second);
    impl_->sessions.erase(it);
  }

  Response response;
  Error error;
  const CommandRequest heartbeat{kHeartbeatCommand, {}};
  if (session->RoundTrip(heartbeat, impl_->config.heartbeat_timeout, &response, &error) &&
      response.ok) {
    session->MarkValidated(std::chrono::steady_clock::now());
    impl_->metrics.sessions_reused.fetch_add(1);
    return session;
  }

  if (error.ok()) {
    error.kind = ErrorKind::kProtocol;
    error.message = "heartbeat returned " + response.raw_status;
  }
  internal::LogDebug(impl_->config, "session to " + address + " failed heartbeat: " +
                                        internal::Describe(error));
  impl_->metrics.heartbeat_failures.fetch_add(1);
  impl_->metrics.sessions_evicted.fetch_add(1);
  session->Close();
  return nullptr;
}

std::unique_ptr<Session> SessionPool::EnsureSession(const std::string& address,
                                                    uint16_t port,
                                                    Error* error) {
  std::unique_ptr<Session> other_port;
  uint64_t epoch = 0;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->shut_down) {
      Fail(error, ErrorKind::kCancelled, "session pool is shut down");
      return nullptr;
    }
    auto it = impl_->sessions.find(address);
    if (it != impl_->sessions.end() && it->second->port() != port) {
      other_port = std::move(it->second);
      impl_->sessions.erase(it);
    }
    epoch = impl_->epoch;
  }
  if (other_port) {
    internal::LogDebug(impl_->config, "closing session to " + address + ":" +
                                          std::to_string(other_port->port()) +
                                          ", port " + std::to_string(port) + " requested");
    impl_->metrics.sessions_evicted.fetch_add(1);
    other_port->Close();
  }

  auto session = GetSession(address);
  if (session) {
    return session;
  }
  auto connection = ConnectWithRetry(impl_->connector, address, port,
                                     impl_->config.connect_timeout,
                                     impl_->config.connect_attempts,
                                     impl_->config.connect_backoff, error);
  if (!connection) {
    return nullptr;
  }
  impl_->metrics.sessions_opened.fetch_add(1);
  internal::LogDebug(impl_->config, "opened session to " + address);
  std::unique_ptr<Session> opened(new Session(address, port, std::move(connection)));
  opened->epoch_ = epoch;
  return opened;
}

void SessionPool::StoreSession(std::unique_ptr<Session> session) {
  if (!session) {
    return;
  }
  if (session->state() != SessionState::kConnected) {
    impl_->metrics.sessions_evicted.fetch_add(1);
    return;
  }
  std::unique_ptr<Session> previous;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->shut_down || session->epoch_ != impl_->epoch) {
      previous = std::move(session);
    } else {
      auto& slot = impl_->sessions[session->address()];
      previous = std::move(slot);
      slot = std::move(session);
    }
  }
  if (previous) {
    impl_->metrics.sessions_evicted.fetch_add(1);
    previous->Close();
  }
}

bool SessionPool::Evict(const std::string& address) {
  std::unique_ptr<Session> removed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->sessions.find(address);
    if (it == impl_->sessions.end()) {
      return false;
    }
    removed = std::move(it->second);
    impl_->sessions.erase(it);
  }
  impl_->metrics.sessions_evicted.fetch_add(1);
  removed->Close();
  return true;
}

size_t SessionPool::EvictAll() {
  std::vector<std::unique_ptr<Session>> removed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    removed = impl_->TakeAllLocked();
  }
  impl_->metrics.sessions_evicted.fetch_add(removed.size());
  return removed.size();
}

size_t SessionPool::Shutdown() {
  std::vector<std::unique_ptr<Session>> removed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->shut_down = true;
    removed = impl_->TakeAllLocked();
  }
  impl_->metrics.sessions_evicted.fetch_add(removed.size());
  return removed.size();
}

size_t SessionPool::SessionCount() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->sessions.size();
}

bool SessionPool::HasSession(const std::string& address) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->sessions.count(address) > 0;
}

std::optional<std::vector<DeviceDescriptor>> SessionPool::GetDirectory() {
  std::vector<DeviceDescriptor> cached;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->ExpiredLocked(std::chrono::steady_clock::now())) {
      return std::nullopt;
    }
    for (const auto& entry : impl_->directory) {
      cached.push_back(entry.descriptor);
    }
    generation = impl_->generation;
  }
  if (!impl_->config.verify_directory) {
    return cached;
  }

  std::vector<DeviceDescriptor> reachable;
  for (const auto& descriptor : cached) {
    if (impl_->probe(descriptor.address, descriptor.port,
                     impl_->config.reachability_timeout)) {
      reachable.push_back(descriptor);
    } else {
      internal::LogInfo(impl_->config,
                        "device " + descriptor.address + " no longer reachable");
    }
  }
  if (!reachable.empty()) {
    return reachable;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->generation == generation) {
    impl_->directory.clear();
    ++impl_->generation;
    internal::LogInfo(impl_->config, "no cached device reachable, directory cleared");
  }
  return std::nullopt;
}

size_t SessionPool::UpdateDirectory(const std::vector<DeviceDescriptor>& descriptors) {
  std::vector<std::unique_ptr<Session>> removed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    removed = impl_->TakeAllLocked();
    const auto now = std::chrono::steady_clock::now();
    std::vector<DirectoryEntry> directory;
    for (const auto& descriptor : descriptors) {
      if (descriptor.address.empty()) {
        continue;
      }
      auto duplicate = std::find_if(directory.begin(), directory.end(),
                                    [&](const DirectoryEntry& entry) {
                                      return entry.descriptor.address == descriptor.address;
                                    });
      if (duplicate != directory.end()) {
        continue;
      }
      directory.push_back(DirectoryEntry{descriptor, now});
    }
    impl_->directory = std::move(directory);
    impl_->discovered_at = now;
    ++impl_->generation;
  }
  impl_->metrics.sessions_evicted.fetch_add(removed.size());
  std::ostringstream oss;
  oss << "directory updated with " << descriptors.size() << " device(s), closed "
      << removed.size() << " session(s)";
  internal::LogDebug(impl_->config, oss.str());
  return removed.size();
}

std::optional<DeviceDescriptor> SessionPool::FindDevice(const std::string& address) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (const auto& entry : impl_->directory) {
    if (entry.descriptor.address == address) {
      return entry.descriptor;
    }
  }
  return std::nullopt;
}

void SessionPool::RefreshDescriptors(const std::vector<DeviceDescriptor>& descriptors) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (auto& entry : impl_->directory) {
    for (const auto& descriptor : descriptors) {
      if (descriptor.address == entry.descriptor.address) {
        entry.descriptor = descriptor;
        break;
      }
    }
  }
  std::stable_sort(impl_->directory.begin(), impl_->directory.end(),
                   [](const DirectoryEntry& a, const DirectoryEntry& b) {
                     return a.descriptor.name < b.descriptor.name;
                   });
}

void SessionPool::InvalidateDirectory() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->directory.clear();
  ++impl_->generation;
}

PoolMetrics SessionPool::GetMetrics() const {
  PoolMetrics out;
  out.sessions_opened = impl_->metrics.sessions_opened.load();
  out.sessions_reused = impl_->metrics.sessions_reused.load();
  out.sessions_evicted = impl_->metrics.sessions_evicted.load();
  out.heartbeat_failures = impl_->metrics.heartbeat_failures.load();
  return out;
}

const Config& SessionPool::config() const { return impl_->config; }

#ifdef HEOS_TESTING
namespace test {

void SetDirectoryTimestamp(SessionPool& pool, std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(pool.impl_->mutex);
  pool.impl_->discovered_at = when;
  for (auto& entry : pool.impl_->directory) {
    entry.discovered_at = when;
  }
}

size_t GetDirectoryRecordCount(SessionPool& pool) {
  std::lock_guard<std::mutex> lock(pool.impl_->mutex);
  return pool.impl_->directory.size();
}

}  // namespace test
#endif

}  // namespace heos
