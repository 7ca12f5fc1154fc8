#include "heos/heos.h"
#include "heos/test_hooks.h"

#include "log.h"

#include <algorithm>
#include <atomic>
#include <sstream>

namespace heos {

struct Controller::Impl {
  Impl(Config cfg, Connector connector, BrowserFactory browser_factory,
       SessionPool::ReachabilityProbe probe)
      : config(std::move(cfg)),
        pool(config, std::move(connector), std::move(probe)),
        dispatcher(config, &pool),
        reconciler(config, &dispatcher, std::move(browser_factory)) {
    std::string validation_error;
    if (!config.Validate(&validation_error)) {
      config_error = "invalid config: " + validation_error;
      internal::LogError(config, config_error);
    }
  }

  // Fails when the controller cannot do work.
  bool CheckUsable(Error* error) const {
    if (!config_error.empty()) {
      return internal::Fail(error, ErrorKind::kInvalidArgument, config_error);
    }
    if (shut_down) {
      return internal::Fail(error, ErrorKind::kCancelled, "controller is shut down");
    }
    return true;
  }

  bool Rediscover(std::chrono::milliseconds timeout, std::vector<DeviceDescriptor>* out,
                  Error* error) {
    std::vector<DeviceDescriptor> found;
    if (!reconciler.Discover(timeout, &found, error)) {
      return false;
    }
    discoveries.fetch_add(1);
    if (found.empty()) {
      if (out) {
        out->clear();
      }
      return true;
    }
    pool.UpdateDirectory(found);
    if (config.enrich_on_discovery) {
      // Enriched descriptors carry the player id; failed ones keep the base.
      // Sessions opened here stay pooled for the first command.
      for (auto& result : reconciler.Enrich(found)) {
        const auto& enriched = result.descriptor();
        for (auto& device : found) {
          if (device.address == enriched.address) {
            device = enriched;
          }
        }
      }
      std::stable_sort(found.begin(), found.end(),
                       [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
                         return a.name < b.name;
                       });
      pool.RefreshDescriptors(found);
    }
    std::ostringstream oss;
    oss << "discovered " << found.size() << " HEOS device(s)";
    internal::LogInfo(config, oss.str());
    if (out) {
      *out = std::move(found);
    }
    return true;
  }

  Config config;
  std::string config_error;
  SessionPool pool;
  Dispatcher dispatcher;
  Reconciler reconciler;
  std::atomic<bool> shut_down{false};
  std::atomic<uint64_t> discoveries{0};
  std::atomic<uint64_t> directory_hits{0};
};

Controller::Controller(Config config)
    : impl_(new Impl(std::move(config), Connector(), BrowserFactory(),
                     SessionPool::ReachabilityProbe())) {}

Controller::Controller(Config config,
                       Connector connector,
                       BrowserFactory browser_factory,
                       SessionPool::ReachabilityProbe probe)
    : impl_(new Impl(std::move(config), std::move(connector), std::move(browser_factory),
                     std::move(probe))) {}

Controller::~Controller() { Shutdown(); }

bool Controller::Discover(std::chrono::milliseconds timeout,
                          std::vector<DeviceDescriptor>* out,
                          Error* error) {
  if (!impl_->CheckUsable(error)) {
    return false;
  }
  auto cached = impl_->pool.GetDirectory();
  if (cached) {
    impl_->directory_hits.fetch_add(1);
    internal::LogDebug(impl_->config, "serving cached directory");
    if (out) {
      *out = std::move(*cached);
    }
    return true;
  }
  return impl_->Rediscover(timeout, out, error);
}

bool Controller::Discover(std::vector<DeviceDescriptor>* out, Error* error) {
  return Discover(impl_->config.discovery_timeout, out, error);
}

bool Controller::ForceRediscovery(std::vector<DeviceDescriptor>* out, Error* error) {
  if (!impl_->CheckUsable(error)) {
    return false;
  }
  return impl_->Rediscover(impl_->config.discovery_timeout, out, error);
}

bool Controller::SendCommand(const std::string& address,
                             const std::string& command,
                             const Params& params,
                             Response* response,
                             Error* error) {
  if (!impl_->CheckUsable(error)) {
    return false;
  }
  const auto device = impl_->pool.FindDevice(address);
  if (!device) {
    return internal::Fail(error, ErrorKind::kDeviceNotFound,
                          "device " + address + " not found");
  }
  return impl_->dispatcher.SendCommand(*device, command, params, response, error);
}

bool Controller::GetStatus(const std::string& address, nlohmann::json* status, Error* error) {
  if (!impl_->CheckUsable(error)) {
    return false;
  }
  const auto device = impl_->pool.FindDevice(address);
  if (!device) {
    return internal::Fail(error, ErrorKind::kDeviceNotFound,
                          "device " + address + " not found");
  }
  DiscoveryResult result = impl_->reconciler.EnrichOne(*device);
  if (!result.ok()) {
    return internal::Fail(error, result.error_kind, result.error);
  }
  if (status) {
    *status = result.snapshot.ToJson();
  }
  return true;
}

bool Controller::DescribeDevices(std::vector<DiscoveryResult>* out, Error* error) {
  std::vector<DeviceDescriptor> devices;
  if (!Discover(&devices, error)) {
    return false;
  }
  std::vector<DiscoveryResult> results = impl_->reconciler.Enrich(devices);
  if (out) {
    *out = std::move(results);
  }
  return true;
}

void Controller::SetHistoryCallback(HistoryCallback cb) {
  impl_->dispatcher.SetHistoryCallback(std::move(cb));
}

void Controller::CancelDiscovery() { impl_->reconciler.Cancel(); }

void Controller::Shutdown() {
  if (impl_->shut_down.exchange(true)) {
    return;
  }
  impl_->reconciler.Cancel();
  const size_t closed = impl_->pool.Shutdown();
  std::ostringstream oss;
  oss << "controller shut down, closed " << closed << " session(s)";
  internal::LogDebug(impl_->config, oss.str());
}

ControllerMetrics Controller::GetMetrics() const {
  ControllerMetrics out;
  out.pool = impl_->pool.GetMetrics();
  out.dispatch = impl_->dispatcher.GetMetrics();
  out.discoveries = impl_->discoveries.load();
  out.directory_hits = impl_->directory_hits.load();
  return out;
}

const Config& Controller::config() const { return impl_->config; }

#ifdef HEOS_TESTING
namespace test {

SessionPool& GetSessionPool(Controller& controller) { return controller.impl_->pool; }

}  // namespace test
#endif

}  // namespace heos
