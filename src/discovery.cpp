#include "emotiva/emotiva.h"
#include "net.h"

#include <cerrno>
#include <cstring>
#include <sstream>

namespace emotiva {

bool Discover(const Config& config, std::vector<DiscoveredDevice>* out,
              Error* error) {
  if (!out) {
    return internal::SetError(error, ErrorCode::kInvalidConfig,
                              "output vector must not be null");
  }
  out->clear();
  std::string config_error;
  if (!config.Validate(&config_error)) {
    internal::LogError(config_error, &config);
    return internal::SetError(error, ErrorCode::kInvalidConfig, config_error);
  }

  // Bind the response socket before pinging so no early reply is lost.
  internal::UdpSocket response_socket;
  if (!response_socket.Open(config.discover_response_port, config.bind_address,
                            false) ||
      !response_socket.SetReceiveTimeout(config.discover_wait)) {
    internal::LogError(response_socket.last_error(), &config);
    return internal::SetError(error, ErrorCode::kSocketError,
                              response_socket.last_error());
  }
  internal::UdpSocket request_socket;
  if (!request_socket.Open(0, config.bind_address, true)) {
    internal::LogError(request_socket.last_error(), &config);
    return internal::SetError(error, ErrorCode::kSocketError,
                              request_socket.last_error());
  }

  const std::vector<uint8_t> ping = Encode(kMessagePing, {});
  const sockaddr_in target = internal::MakeSockaddr(config.broadcast_address,
                                                    config.discover_request_port);
  const ssize_t sent = request_socket.SendTo(ping, target);
  if (sent < 0 || static_cast<size_t>(sent) != ping.size()) {
    std::ostringstream oss;
    oss << "Failed to send discovery ping to " << config.broadcast_address << ":"
        << config.discover_request_port << ": "
        << (sent < 0 ? std::strerror(errno) : "partial send");
    internal::LogError(oss.str(), &config);
    return internal::SetError(error, ErrorCode::kSocketError, oss.str());
  }

  // Each datagram restarts the discover_wait window.
  std::vector<uint8_t> buffer;
  while (true) {
    sockaddr_in source{};
    const ReceiveStatus status =
        response_socket.Receive(config.max_datagram_size, &buffer, &source);
    if (status == ReceiveStatus::kTimeout) {
      break;
    }
    if (status == ReceiveStatus::kError) {
      internal::LogError("discovery: " + response_socket.last_error(), &config);
      break;
    }
    const std::string address = internal::AddrToString(source);
    Error decode_error;
    auto advertisement = Decode(buffer, &decode_error);
    if (!advertisement.has_value()) {
      internal::LogError("discovery: skipping response from " + address + ": " +
                             decode_error.message,
                         &config);
      continue;
    }
    out->push_back(DiscoveredDevice{address, std::move(*advertisement)});
  }
  return true;
}

bool DiscoverDevices(const Config& config, std::vector<DeviceDescriptor>* out,
                     Error* error) {
  if (!out) {
    return internal::SetError(error, ErrorCode::kInvalidConfig,
                              "output vector must not be null");
  }
  out->clear();
  std::vector<DiscoveredDevice> found;
  if (!Discover(config, &found, error)) {
    return false;
  }
  for (const auto& device : found) {
    Error parse_error;
    auto descriptor = ParseAdvertisement(device.address, device.advertisement,
                                         &parse_error);
    if (!descriptor.has_value()) {
      internal::LogError("discovery: " + parse_error.message, &config);
      continue;
    }
    out->push_back(std::move(*descriptor));
  }
  return true;
}

}  // namespace emotiva
