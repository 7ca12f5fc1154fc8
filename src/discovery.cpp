#include "heos/discovery.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <map>
#include <mutex>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace heos {
namespace {

using Clock = std::chrono::steady_clock;

// String or integer member of a JSON object as text, empty otherwise.
std::string JsonText(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::string();
  }
  const auto it = object.find(key);
  if (it == object.end()) {
    return std::string();
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<int64_t>());
  }
  return std::string();
}

std::optional<int> ParseInt(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

// Stops the browser on every exit path of a scan.
class BrowserGuard {
 public:
  explicit BrowserGuard(ServiceBrowser* browser) : browser_(browser) {}
  ~BrowserGuard() {
    if (browser_) {
      browser_->Stop();
    }
  }

  BrowserGuard(const BrowserGuard&) = delete;
  BrowserGuard& operator=(const BrowserGuard&) = delete;

 private:
  ServiceBrowser* browser_;
};

}  // namespace

bool IsLinkLocal(const std::string& address) {
  in_addr addr{};
  if (::inet_pton(AF_INET, address.c_str(), &addr) != 1) {
    return false;
  }
  const uint32_t host = ntohl(addr.s_addr);
  return (host & 0xffff0000u) == 0xa9fe0000u;
}

std::optional<DeviceDescriptor> DescriptorFromService(const ResolvedService& service,
                                                      uint16_t cli_port) {
  auto address = std::find_if(service.addresses.begin(), service.addresses.end(),
                              [](const std::string& a) { return !IsLinkLocal(a); });
  if (address == service.addresses.end()) {
    return std::nullopt;
  }
  auto txt = [&](const char* key) {
    auto it = service.txt.find(key);
    return it == service.txt.end() ? std::string() : it->second;
  };
  DeviceDescriptor descriptor;
  descriptor.name = service.name;
  descriptor.address = *address;
  descriptor.port = cli_port;
  descriptor.model = txt("model");
  descriptor.firmware_version = txt("vers");
  descriptor.network_id = txt("networkid");
  descriptor.serial = txt("did");
  return descriptor;
}

struct Reconciler::Impl {
  Impl(const Config& cfg, Dispatcher* disp, BrowserFactory browser_factory)
      : config(cfg), dispatcher(disp), factory(std::move(browser_factory)) {
    if (!factory) {
      factory = [](const Config& c) -> std::unique_ptr<ServiceBrowser> {
        return std::unique_ptr<ServiceBrowser>(new MdnsBrowser(c));
      };
    }
  }

  // Marks the scan finished and wakes anyone waiting to start the next one.
  class ScanGuard {
   public:
    explicit ScanGuard(Impl* impl) : impl_(impl) {}
    ~ScanGuard() {
      std::lock_guard<std::mutex> lock(impl_->mutex);
      impl_->in_progress = false;
      impl_->cancel_requested = false;
      impl_->active_browser.reset();
      impl_->cv.notify_all();
    }

    ScanGuard(const ScanGuard&) = delete;
    ScanGuard& operator=(const ScanGuard&) = delete;

   private:
    Impl* impl_;
  };

  void OnServiceSeen(const std::string& service_type, const std::string& instance) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!in_progress) {
      return;
    }
    if (seen.emplace(instance, service_type).second) {
      internal::LogInfo(config, "found HEOS service: " + instance);
    }
    if (!first_seen) {
      first_seen = Clock::now();
    }
    cv.notify_all();
  }

  bool Cancelled() {
    std::lock_guard<std::mutex> lock(mutex);
    return cancel_requested;
  }

  bool Query(const DeviceDescriptor& device, const std::string& command,
             const Params& params, Response* response, Error* error) {
    if (!dispatcher) {
      return internal::Fail(error, ErrorKind::kInvalidArgument, "no dispatcher for enrichment");
    }
    return dispatcher->SendCommand(device, command, params, response, error);
  }

  Config config;
  Dispatcher* dispatcher = nullptr;
  BrowserFactory factory;

  mutable std::mutex mutex;
  std::condition_variable cv;
  bool in_progress = false;
  bool cancel_requested = false;
  std::map<std::string, std::string> seen;
  std::optional<Clock::time_point> first_seen;
  // Browser of the scan in flight, stopped by Cancel to wake a pending Resolve.
  std::shared_ptr<ServiceBrowser> active_browser;
  std::atomic<uint64_t> scans_completed{0};
};

Reconciler::Reconciler(const Config& config, Dispatcher* dispatcher, BrowserFactory factory)
    : impl_(new Impl(config, dispatcher, std::move(factory))) {}

Reconciler::~Reconciler() {
  Cancel();
  std::unique_lock<std::mutex> lock(impl_->mutex);
  impl_->cv.wait(lock, [this]() { return !impl_->in_progress; });
}

bool Reconciler::Discover(std::chrono::milliseconds timeout,
                          std::vector<DeviceDescriptor>* out,
                          Error* error) {
  if (timeout.count() <= 0) {
    return internal::Fail(error, ErrorKind::kInvalidArgument,
                          "discovery timeout must be positive");
  }
  {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (impl_->in_progress) {
      internal::LogDebug(impl_->config, "cancelling discovery scan in flight");
      lock.unlock();
      Cancel();
      lock.lock();
      impl_->cv.wait(lock, [this]() { return !impl_->in_progress; });
    }
    impl_->in_progress = true;
    impl_->cancel_requested = false;
    impl_->seen.clear();
    impl_->first_seen.reset();
  }
  Impl::ScanGuard scan_guard(impl_.get());

  const auto started = Clock::now();
  const auto deadline = started + timeout;
  std::shared_ptr<ServiceBrowser> browser = impl_->factory(impl_->config);
  if (!browser) {
    return internal::Fail(error, ErrorKind::kDiscoveryFailed, "no service browser available");
  }
  BrowserGuard browser_guard(browser.get());

  Error start_error;
  if (!browser->Start(impl_->config.service_types,
                      [this](const std::string& type, const std::string& instance) {
                        impl_->OnServiceSeen(type, instance);
                      },
                      &start_error)) {
    return internal::Fail(error, ErrorKind::kDiscoveryFailed,
                          "service browser failed to start: " + start_error.message);
  }
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->active_browser = browser;
  }

  std::map<std::string, std::string> instances;
  {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    for (;;) {
      if (impl_->cancel_requested) {
        internal::LogInfo(impl_->config, "discovery cancelled");
        return internal::Fail(error, ErrorKind::kCancelled, "discovery cancelled");
      }
      const auto now = Clock::now();
      if (now >= deadline) {
        break;
      }
      auto wake = deadline;
      if (impl_->first_seen) {
        const auto settled = *impl_->first_seen + impl_->config.discovery_settle_delay;
        if (now >= settled) {
          break;
        }
        wake = std::min(wake, settled);
      }
      impl_->cv.wait_until(lock, wake);
    }
    instances = impl_->seen;
  }

  if (instances.empty()) {
    internal::LogWarning(impl_->config, "no HEOS devices found");
    impl_->scans_completed.fetch_add(1);
    if (out) {
      out->clear();
    }
    return true;
  }

  // Resolution may overrun the scan timeout by at most one resolve_timeout.
  const auto resolve_deadline = deadline + impl_->config.resolve_timeout;
  std::vector<DeviceDescriptor> resolved_devices;
  for (const auto& entry : instances) {
    if (impl_->Cancelled()) {
      internal::LogInfo(impl_->config, "discovery cancelled");
      return internal::Fail(error, ErrorKind::kCancelled, "discovery cancelled");
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        resolve_deadline - Clock::now());
    if (left.count() <= 0) {
      internal::LogWarning(impl_->config, "discovery deadline reached before resolving " +
                                              entry.first);
      break;
    }
    const auto resolved =
        browser->Resolve(entry.second, entry.first, std::min(impl_->config.resolve_timeout, left));
    if (impl_->Cancelled()) {
      internal::LogInfo(impl_->config, "discovery cancelled");
      return internal::Fail(error, ErrorKind::kCancelled, "discovery cancelled");
    }
    if (!resolved) {
      internal::LogWarning(impl_->config, "could not resolve " + entry.first);
      continue;
    }
    auto descriptor = DescriptorFromService(*resolved, impl_->config.cli_port);
    if (!descriptor) {
      internal::LogDebug(impl_->config, "skipping " + entry.first + ": no usable address");
      continue;
    }
    resolved_devices.push_back(std::move(*descriptor));
  }

  // Sorted by name first, so address dedup keeps the first device by name.
  std::stable_sort(resolved_devices.begin(), resolved_devices.end(),
                   [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
                     return a.name < b.name;
                   });
  std::vector<DeviceDescriptor> devices;
  for (auto& descriptor : resolved_devices) {
    const bool duplicate = std::any_of(devices.begin(), devices.end(),
                                       [&](const DeviceDescriptor& d) {
                                         return d.address == descriptor.address;
                                       });
    if (duplicate) {
      internal::LogDebug(impl_->config, "skipping " + descriptor.name + ": duplicate address " +
                                            descriptor.address);
      continue;
    }
    internal::LogInfo(impl_->config, "found HEOS device: " + descriptor.name + " at " +
                                         descriptor.address);
    devices.push_back(std::move(descriptor));
  }
  impl_->scans_completed.fetch_add(1);
  if (out) {
    *out = std::move(devices);
  }
  return true;
}

std::vector<DiscoveryResult> Reconciler::Enrich(const std::vector<DeviceDescriptor>& devices) {
  std::vector<DiscoveryResult> results;
  results.reserve(devices.size());
  for (const auto& device : devices) {
    results.push_back(EnrichOne(device));
  }
  return results;
}

DiscoveryResult Reconciler::EnrichOne(const DeviceDescriptor& device) {
  auto failed = [&](const Error& error) {
    internal::LogWarning(impl_->config, "enrichment of " + device.address + " failed: " +
                                            internal::Describe(error));
    return DiscoveryResult::Failed(device, internal::Describe(error), error.kind);
  };

  Response response;
  Error error;
  if (!impl_->Query(device, "player/get_players", {}, &response, &error)) {
    return failed(error);
  }
  if (!response.payload.is_array() || response.payload.empty()) {
    return failed(Error{ErrorKind::kProtocol, "no players reported"});
  }
  nlohmann::json player = response.payload.front();
  for (const auto& candidate : response.payload) {
    if (JsonText(candidate, "ip") == device.address) {
      player = candidate;
      break;
    }
  }
  const nlohmann::json& record = player;
  const std::string pid = JsonText(record, "pid");
  if (pid.empty()) {
    return failed(Error{ErrorKind::kProtocol, "player record has no pid"});
  }

  DeviceSnapshot snapshot;
  snapshot.descriptor = device;
  snapshot.descriptor.id = pid;
  auto take = [&](const char* key, std::string* field) {
    const std::string value = JsonText(record, key);
    if (!value.empty()) {
      *field = value;
    }
  };
  take("name", &snapshot.descriptor.name);
  take("model", &snapshot.descriptor.model);
  take("version", &snapshot.descriptor.firmware_version);
  take("serial", &snapshot.descriptor.serial);
  snapshot.player = player;

  // Older firmware leaves the version out of the player record.
  if (impl_->Query(device, "system/get_version", {}, &response, &error)) {
    const std::string version = JsonText(response.payload, "version");
    if (!version.empty()) {
      snapshot.descriptor.firmware_version = version;
    }
  } else if (IsRetryable(error.kind)) {
    return failed(error);
  } else {
    internal::LogDebug(impl_->config, "no version from " + device.address + ": " +
                                          internal::Describe(error));
  }

  const Params by_pid = {{"pid", pid}};
  if (!impl_->Query(device, "player/get_play_state", by_pid, &response, &error)) {
    return failed(error);
  }
  snapshot.play_state = FindField(response.message_fields, "state").value_or("");

  if (!impl_->Query(device, "player/get_volume", by_pid, &response, &error)) {
    return failed(error);
  }
  snapshot.volume = ParseInt(FindField(response.message_fields, "level").value_or(""));

  if (!impl_->Query(device, "player/get_mute", by_pid, &response, &error)) {
    return failed(error);
  }
  const auto mute = FindField(response.message_fields, "state");
  if (mute) {
    snapshot.muted = *mute == "on";
  }

  if (!impl_->Query(device, "player/get_now_playing_media", by_pid, &response, &error)) {
    return failed(error);
  }
  snapshot.now_playing = response.payload;

  if (!impl_->Query(device, "player/get_queue", {{"pid", pid}, {"range", "0,0"}},
                    &response, &error)) {
    return failed(error);
  }
  if (response.payload.is_array() && !response.payload.empty()) {
    snapshot.queue_head = response.payload.front();
  }

  if (!impl_->Query(device, "group/get_groups", {}, &response, &error)) {
    return failed(error);
  }
  if (response.payload.is_array()) {
    for (const auto& group : response.payload) {
      if (!group.is_object()) {
        continue;
      }
      const auto players = group.find("players");
      if (players == group.end() || !players->is_array()) {
        continue;
      }
      const bool member = std::any_of(players->begin(), players->end(),
                                      [&](const nlohmann::json& p) {
                                        return JsonText(p, "pid") == pid;
                                      });
      if (member) {
        snapshot.group = group;
        break;
      }
    }
  }
  return DiscoveryResult::Ok(std::move(snapshot));
}

void Reconciler::Cancel() {
  std::shared_ptr<ServiceBrowser> browser;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->in_progress) {
      return;
    }
    impl_->cancel_requested = true;
    browser = impl_->active_browser;
    impl_->cv.notify_all();
  }
  // Outside the lock: Stop joins the receive thread, whose callbacks take it.
  if (browser) {
    browser->Stop();
  }
}

bool Reconciler::InProgress() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->in_progress;
}

uint64_t Reconciler::scans_completed() const { return impl_->scans_completed.load(); }

}  // namespace heos
