#pragma once

#include "emotiva/emotiva.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace emotiva {
namespace internal {

// Write a log line through config->log_callback or to stderr.
void LogError(const std::string& message, const Config* config);

// Fill *error (if non-null) and return false.
bool SetError(Error* error, ErrorCode code, const std::string& message);

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);

std::string AddrToString(const sockaddr_in& addr);

bool IsValidIpv4(const std::string& address);

// Minimal UDP socket wrapper for send/recv with broadcast support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, bool allow_broadcast,
            bool non_blocking = false);
  void Close();

  // Bound local port, or 0 if the socket is closed.
  uint16_t LocalPort() const;
  bool SetReceiveTimeout(std::chrono::milliseconds timeout);

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr);

  // One recvfrom(). A timeout (or EAGAIN on a non-blocking socket) is
  // reported as kTimeout, never as kError.
  ReceiveStatus Receive(size_t max_size, std::vector<uint8_t>* buffer,
                        sockaddr_in* source);

 private:
  int fd_ = -1;
  std::string last_error_;
};

}  // namespace internal
}  // namespace emotiva
