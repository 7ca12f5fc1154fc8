// Example: send one CLI command to a discovered HEOS player.
#include "heos/heos.h"

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cout << "Usage: heos_send_command <device_ip> <group/command> [key=value ...]\n"
                 "Example: heos_send_command 192.168.1.20 player/get_volume pid=12345\n";
    return 1;
  }
  const std::string address = argv[1];
  const std::string command = argv[2];

  heos::Params params;
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    const size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "Invalid parameter (expected key=value): " << arg << std::endl;
      return 1;
    }
    params.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
  }

  heos::Config config;
  config.enrich_on_discovery = false;
  heos::Controller controller(config);
  controller.SetHistoryCallback([](const std::string& cmd, const heos::DeviceDescriptor& device,
                                   const heos::Response& response) {
    std::cout << "history: " << cmd << " -> " << device.name << " (" << device.address
              << ") result=" << response.raw_status << std::endl;
  });

  heos::Error error;
  std::vector<heos::DeviceDescriptor> devices;
  if (!controller.Discover(&devices, &error)) {
    std::cerr << "Discovery failed: " << error.message << std::endl;
    return 1;
  }

  heos::Response response;
  if (!controller.SendCommand(address, command, params, &response, &error)) {
    std::cerr << "Command failed: " << heos::ToString(error.kind) << ": " << error.message
              << std::endl;
    return 1;
  }
  std::cout << "message: " << response.message << std::endl;
  if (!response.payload.is_null()) {
    std::cout << response.payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  return 0;
}
