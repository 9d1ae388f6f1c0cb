// Example: broadcast a discovery ping and print every responding device.
#include "emotiva/emotiva.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  emotiva::Config config;
  if (argc > 1) {
    config.broadcast_address = argv[1];
  }

  std::vector<emotiva::DeviceDescriptor> devices;
  emotiva::Error error;
  if (!emotiva::DiscoverDevices(config, &devices, &error)) {
    std::cerr << "Discovery failed: " << error.message << std::endl;
    return 1;
  }

  std::cout << "Discovered devices: " << devices.size() << std::endl;
  for (const auto& device : devices) {
    std::cout << " - " << device.name << " (" << device.model << ") ip=" << device.address
              << " control=" << *device.control_port << " notify=" << *device.notify_port;
    if (device.protocol_version.has_value()) {
      std::cout << " protocol=" << *device.protocol_version;
    }
    if (device.info_port.has_value()) {
      std::cout << " info=" << *device.info_port;
    }
    std::cout << std::endl;
  }
  return 0;
}
