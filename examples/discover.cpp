// Example: discover HEOS players and print their enriched status.
#include "heos/heos.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

int main(int argc, char** argv) {
  heos::Config config;
  bool enrich = true;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--no-enrich") {
      enrich = false;
    } else if (arg == "--debug") {
      config.log_level = heos::LogLevel::kDebug;
    } else if (arg == "--timeout" && i + 1 < argc) {
      config.discovery_timeout = std::chrono::milliseconds(std::atoi(argv[++i]));
    } else if (arg == "--interface" && i + 1 < argc) {
      config.bind_address = argv[++i];
    } else {
      std::cout << "Usage: heos_discover [--timeout ms] [--interface ip] "
                   "[--no-enrich] [--debug]\n";
      return 1;
    }
  }
  config.enrich_on_discovery = enrich;

  std::string validation_error;
  if (!config.Validate(&validation_error)) {
    std::cerr << "Invalid config: " << validation_error << std::endl;
    return 1;
  }

  heos::Controller controller(config);
  heos::Error error;
  std::vector<heos::DeviceDescriptor> devices;
  if (!controller.Discover(&devices, &error)) {
    std::cerr << "Discovery failed: " << heos::ToString(error.kind) << ": "
              << error.message << std::endl;
    return 1;
  }
  std::cout << "Discovered devices: " << devices.size() << std::endl;
  for (const auto& device : devices) {
    std::cout << " - " << device.name << " ip=" << device.address
              << " model=" << device.model << " version=" << device.firmware_version
              << std::endl;
  }
  if (!enrich || devices.empty()) {
    return 0;
  }

  for (const auto& device : devices) {
    nlohmann::json status;
    if (!controller.GetStatus(device.address, &status, &error)) {
      std::cerr << device.address << ": " << heos::ToString(error.kind) << ": "
                << error.message << std::endl;
      continue;
    }
    std::cout << status.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  return 0;
}
