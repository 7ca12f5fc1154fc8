#pragma once

#include "heos/codec.h"
#include "heos/config.h"
#include "heos/discovery.h"
#include "heos/dispatcher.h"
#include "heos/mdns.h"
#include "heos/session_pool.h"
#include "heos/transport.h"
#include "heos/types.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace heos {

class Controller;

#ifdef HEOS_TESTING
namespace test {
SessionPool& GetSessionPool(Controller& controller);
}  // namespace test
#endif

/**
 * Entry point for HEOS device control: discovery, the device directory and
 * command dispatch.
 *
 * Construct one per process and keep it alive for as long as devices are
 * controlled. All methods are thread-safe.
 */
class Controller {
 public:
  using HistoryCallback = Dispatcher::HistoryCallback;

  /// Construct a controller with the provided configuration.
  explicit Controller(Config config);
  /**
   * Construct with injected collaborators. Empty functions fall back to the
   * TCP connector, the mDNS browser and the TCP reachability probe.
   */
  Controller(Config config,
             Connector connector,
             BrowserFactory browser_factory,
             SessionPool::ReachabilityProbe probe = {});
  /// Shut down and close every session.
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /**
   * Return the directory when it is fresh and reachable; otherwise scan.
   *
   * A scan that finds nothing yields an empty list and leaves the directory
   * untouched.
   */
  bool Discover(std::chrono::milliseconds timeout,
                std::vector<DeviceDescriptor>* out,
                Error* error);
  /// Discover with the configured discovery_timeout.
  bool Discover(std::vector<DeviceDescriptor>* out, Error* error);

  /// Scan regardless of the directory's state.
  bool ForceRediscovery(std::vector<DeviceDescriptor>* out, Error* error);

  /**
   * Send a command to a device from the directory.
   *
   * @return false with kDeviceNotFound when the address was never discovered.
   */
  bool SendCommand(const std::string& address,
                   const std::string& command,
                   const Params& params,
                   Response* response,
                   Error* error);

  /// Enrich one device and render the snapshot as JSON.
  bool GetStatus(const std::string& address, nlohmann::json* status, Error* error);

  /// Directory (discovering when needed) plus enrichment, one result per device.
  bool DescribeDevices(std::vector<DiscoveryResult>* out, Error* error);

  /// Set callback invoked after each successful command.
  void SetHistoryCallback(HistoryCallback cb);

  /// Interrupt a scan in flight.
  void CancelDiscovery();

  /// Cancel discovery and close every session. Idempotent.
  void Shutdown();

  ControllerMetrics GetMetrics() const;
  const Config& config() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef HEOS_TESTING
  friend SessionPool& test::GetSessionPool(Controller& controller);
#endif
};

}  // namespace heos
