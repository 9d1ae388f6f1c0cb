// Example: connect to every discovered device and print notifications.
#include "emotiva/emotiva.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace {

std::mutex g_print_mutex;

void PrintElement(const emotiva::Element& element, int depth) {
  std::cout << std::string(depth * 2, ' ') << element.name;
  for (const auto& attribute : element.attributes) {
    std::cout << " " << attribute.first << "=" << attribute.second;
  }
  if (!element.text.empty()) {
    std::cout << " \"" << element.text << "\"";
  }
  std::cout << "\n";
  for (const auto& child : element.children) {
    PrintElement(child, depth + 1);
  }
}

}  // namespace

int main() {
  emotiva::Config config;
  config.log_callback = [](const std::string& line) {
    std::lock_guard<std::mutex> lock(g_print_mutex);
    std::cerr << "[emotiva] " << line << std::endl;
  };

  std::vector<emotiva::DeviceDescriptor> found;
  emotiva::Error error;
  if (!emotiva::DiscoverDevices(config, &found, &error)) {
    std::cerr << "Discovery failed: " << error.message << std::endl;
    return 1;
  }
  if (found.empty()) {
    std::cout << "No devices found." << std::endl;
    return 0;
  }

  emotiva::Notifier notifier(config);
  if (!notifier.Start()) {
    std::cerr << "Failed to start notifier: " << notifier.GetLastError() << std::endl;
    return 1;
  }

  std::vector<std::unique_ptr<emotiva::Device>> devices;
  for (const auto& descriptor : found) {
    auto device = std::make_unique<emotiva::Device>(descriptor, notifier, config);
    const std::string label = descriptor.name + " (" + descriptor.address + ")";
    device->SetNotificationCallback([label](const emotiva::Element& notification) {
      std::lock_guard<std::mutex> lock(g_print_mutex);
      std::cout << "Notification from " << label << ":\n";
      PrintElement(notification, 1);
      std::cout.flush();
    });
    if (!device->Connect(&error)) {
      std::cerr << "Failed to connect to " << label << ": " << error.message << std::endl;
      continue;
    }
    std::cout << "Connected to " << label << std::endl;
    devices.push_back(std::move(device));
  }

  std::cout << "Listening. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  devices.clear();
  notifier.Stop();
  return 0;
}
