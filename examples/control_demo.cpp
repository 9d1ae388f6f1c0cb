// Example: discover the first device and send a few control commands.
#include "emotiva/emotiva.h"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

void PrintReplies(const std::string& what, const std::vector<emotiva::Element>& replies) {
  std::cout << what << ": " << replies.size() << " replies" << std::endl;
  for (const auto& reply : replies) {
    std::cout << "  " << reply.name;
    for (const auto& child : reply.children) {
      std::cout << " " << child.name;
      const auto status = child.GetAttribute("status");
      if (status.has_value()) {
        std::cout << "=" << *status;
      }
    }
    std::cout << std::endl;
  }
}

}  // namespace

int main() {
  emotiva::Config config;
  std::vector<emotiva::DiscoveredDevice> found;
  emotiva::Error error;
  if (!emotiva::Discover(config, &found, &error)) {
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
  auto device = emotiva::Device::Create(found.front().address,
                                        found.front().advertisement, notifier, config,
                                        &error);
  if (!device) {
    std::cerr << "Unusable advertisement: " << error.message << std::endl;
    return 1;
  }
  device->SetNotificationCallback([](const emotiva::Element& notification) {
    std::cout << "notify: " << notification.children.size() << " properties" << std::endl;
  });
  if (!device->Connect(&error)) {
    std::cerr << "Failed to connect: " << error.message << std::endl;
    return 1;
  }
  std::cout << "Connected to " << device->descriptor().name << std::endl;

  std::vector<emotiva::Element> replies;
  if (device->SendCommand("volume", "1", &replies)) {
    PrintReplies("volume +1", replies);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  if (device->SendCommand("volume", "-1", &replies)) {
    PrintReplies("volume -1", replies);
  }

  const auto update = emotiva::Encode(emotiva::kMessageUpdate,
                                      {{"power", {}}, {"volume", {}}, {"source", {}}});
  if (device->SendRequest(update, &replies)) {
    PrintReplies("update", replies);
  } else {
    std::cerr << "Update failed: " << device->GetLastError() << std::endl;
  }

  const auto metrics = device->GetMetrics();
  std::cout << "requests=" << metrics.requests_sent << " replies=" << metrics.replies_received
            << " notifications=" << metrics.notifications_received << std::endl;

  std::cout << "Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  device->Disconnect();
  notifier.Stop();
  return 0;
}
