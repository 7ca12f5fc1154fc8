#pragma once

#include "heos/config.h"
#include "heos/dispatcher.h"
#include "heos/mdns.h"
#include "heos/types.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace heos {

/// Creates a fresh browser for each scan.
using BrowserFactory = std::function<std::unique_ptr<ServiceBrowser>(const Config& config)>;

/// True for 169.254.0.0/16.
bool IsLinkLocal(const std::string& address);

/**
 * Build a descriptor from a resolved service: first non-link-local address,
 * instance label as name, TXT model/vers/networkid/did.
 *
 * @return nullopt when the service has no usable address.
 */
std::optional<DeviceDescriptor> DescriptorFromService(const ResolvedService& service,
                                                      uint16_t cli_port);

/**
 * Turns intermittent mDNS announcements into a sorted, deduplicated device
 * list, and optionally enriches devices through the dispatcher.
 *
 * At most one scan runs at a time; starting a scan cancels the one in flight.
 */
class Reconciler {
 public:
  /**
   * @param dispatcher Used by Enrich; may be null when enrichment is unused.
   * @param factory Browser factory; defaults to MdnsBrowser.
   */
  Reconciler(const Config& config, Dispatcher* dispatcher, BrowserFactory factory = {});
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  /**
   * Run one bounded scan. Finding nothing is not an error: out is empty and
   * the call succeeds.
   *
   * @return false on kInvalidArgument, kDiscoveryFailed or kCancelled.
   */
  bool Discover(std::chrono::milliseconds timeout,
                std::vector<DeviceDescriptor>* out,
                Error* error);

  /// Query player, queue and group state for each device.
  std::vector<DiscoveryResult> Enrich(const std::vector<DeviceDescriptor>& devices);
  DiscoveryResult EnrichOne(const DeviceDescriptor& device);

  /// Interrupt the scan in flight, if any.
  void Cancel();
  bool InProgress() const;

  uint64_t scans_completed() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace heos
