#include "emotiva/emotiva.h"
#include "net.h"

namespace emotiva {

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!internal::IsValidIpv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (!internal::IsValidIpv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (discover_request_port == 0) {
    return fail("discover_request_port must be non-zero");
  }
  if (discover_response_port == 0) {
    return fail("discover_response_port must be non-zero");
  }
  if (discover_wait.count() <= 0) {
    return fail("discover_wait must be positive");
  }
  if (control_timeout.count() <= 0) {
    return fail("control_timeout must be positive");
  }
  if (poll_interval.count() <= 0) {
    return fail("poll_interval must be positive");
  }
  if (max_datagram_size == 0) {
    return fail("max_datagram_size must be non-zero");
  }
  return true;
}

}  // namespace emotiva
