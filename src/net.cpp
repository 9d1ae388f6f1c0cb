#include "net.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/time.h>
#include <unistd.h>

namespace emotiva {
namespace internal {

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[emotiva] " << message << std::endl;
}

bool SetError(Error* error, ErrorCode code, const std::string& message) {
  if (error) {
    error->code = code;
    error->message = message;
  }
  return false;
}

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address,
                     bool allow_broadcast, bool non_blocking) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = "socket() failed: " + std::string(std::strerror(errno));
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    last_error_ = "setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno));
    Close();
    return false;
  }
  if (allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      last_error_ = "setsockopt(SO_BROADCAST) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
  }
  if (non_blocking) {
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error_ = "fcntl(O_NONBLOCK) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpSocket::LocalPort() const {
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t addr_len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool UdpSocket::SetReceiveTimeout(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    last_error_ = "setsockopt(SO_RCVTIMEO) failed: " + std::string(std::strerror(errno));
    return false;
  }
  return true;
}

ssize_t UdpSocket::SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
  return ::sendto(fd_, data.data(), data.size(), 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ReceiveStatus UdpSocket::Receive(size_t max_size, std::vector<uint8_t>* buffer,
                                 sockaddr_in* source) {
  buffer->resize(max_size);
  ssize_t bytes = -1;
  do {
    socklen_t addr_len = sizeof(*source);
    bytes = ::recvfrom(fd_, buffer->data(), buffer->size(), 0,
                       reinterpret_cast<sockaddr*>(source), &addr_len);
  } while (bytes < 0 && errno == EINTR);
  if (bytes < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReceiveStatus::kTimeout;
    }
    last_error_ = "recvfrom() failed: " + std::string(std::strerror(errno));
    return ReceiveStatus::kError;
  }
  buffer->resize(static_cast<size_t>(bytes));
  return ReceiveStatus::kData;
}

}  // namespace internal
}  // namespace emotiva
