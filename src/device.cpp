#include "emotiva/emotiva.h"
#include "emotiva/test_hooks.h"
#include "net.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

namespace emotiva {
namespace {

// Port text must be a plain decimal in 1..65535.
std::optional<uint16_t> ParsePort(const std::optional<std::string>& text) {
  if (!text.has_value() || text->empty() || text->front() == '-') {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long value = std::strtoul(text->c_str(), &end, 10);
  if (errno != 0 || end == text->c_str() || *end != '\0' || value == 0 ||
      value > 0xffff) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

std::vector<Command> EventCommands(const std::vector<std::string>& events) {
  std::vector<Command> commands;
  commands.reserve(events.size());
  for (const auto& event : events) {
    commands.push_back(Command{event, {}});
  }
  return commands;
}

struct DeviceMetricsAtomic {
  std::atomic<uint64_t> requests_sent{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> replies_received{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> notifications_received{0};
  std::atomic<uint64_t> callback_exceptions{0};

  DeviceMetrics Snapshot() const {
    DeviceMetrics snapshot;
    snapshot.requests_sent = requests_sent.load();
    snapshot.send_errors = send_errors.load();
    snapshot.replies_received = replies_received.load();
    snapshot.parse_errors = parse_errors.load();
    snapshot.notifications_received = notifications_received.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

}  // namespace

bool DeviceDescriptor::IsUsable() const {
  return control_port.has_value() && notify_port.has_value();
}

std::optional<DeviceDescriptor> ParseAdvertisement(const std::string& address,
                                                   const Element& advertisement,
                                                   Error* error) {
  DeviceDescriptor descriptor;
  descriptor.address = address;

  const auto name = advertisement.ChildText("name");
  if (name.has_value() && !name->empty()) {
    descriptor.name = *name;
  }
  const auto model = advertisement.ChildText("model");
  if (model.has_value() && !model->empty()) {
    descriptor.model = *model;
  }

  if (const Element* control = advertisement.FindChild("control")) {
    descriptor.protocol_version = control->ChildText("version");
    descriptor.control_port = ParsePort(control->ChildText("controlPort"));
    descriptor.notify_port = ParsePort(control->ChildText("notifyPort"));
    descriptor.info_port = ParsePort(control->ChildText("infoPort"));
    descriptor.setup_port_tcp = ParsePort(control->ChildText("setupPortTCP"));
  }

  if (!descriptor.IsUsable()) {
    internal::SetError(error, ErrorCode::kInvalidAdvertisement,
                       "advertisement from " + address +
                           " is missing control/notify port");
    return std::nullopt;
  }
  return descriptor;
}

struct Device::Impl : std::enable_shared_from_this<Device::Impl> {
  Impl(DeviceDescriptor descriptor, Notifier& notifier, Config config)
      : descriptor_(std::move(descriptor)),
        notifier_(notifier),
        config_(std::move(config)) {}

  bool Connect(Error* error) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (connected_) {
      if (IsLiveLocked()) {
        return true;
      }
      // The notifier was restarted and dropped our handler.
      DisconnectLocked();
    }
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      return Fail(error, ErrorCode::kInvalidConfig, config_error);
    }
    if (!internal::IsValidIpv4(descriptor_.address)) {
      return Fail(error, ErrorCode::kInvalidConfig,
                  "device address must be a valid IPv4 address: " + descriptor_.address);
    }
    if (!descriptor_.IsUsable()) {
      return Fail(error, ErrorCode::kInvalidAdvertisement,
                  "device " + descriptor_.address + " has no control/notify port");
    }

    // The device replies to the port it was addressed on, so listen there.
    if (!control_socket_.Open(*descriptor_.control_port, config_.bind_address, false) ||
        !control_socket_.SetReceiveTimeout(config_.control_timeout)) {
      const std::string message = control_socket_.last_error();
      control_socket_.Close();
      return Fail(error, ErrorCode::kSocketError, message);
    }

    std::weak_ptr<Impl> weak_self = shared_from_this();
    Error register_error;
    epoch_ = notifier_.RegistrationEpoch();
    const bool registered = notifier_.Register(
        descriptor_.address, *descriptor_.notify_port,
        [weak_self](const std::vector<uint8_t>& data) {
          if (auto self = weak_self.lock()) {
            self->HandleNotification(data);
          }
        },
        &register_error, &owns_handler_);
    if (!registered) {
      control_socket_.Close();
      return Fail(error, register_error.code, register_error.message);
    }
    connected_ = true;

    std::vector<std::string> events(kNotifyEvents.begin(), kNotifyEvents.end());
    if (!SendRequestLocked(Encode(kMessageSubscription, EventCommands(events)),
                           nullptr, true)) {
      const std::string message = GetLastError();
      DisconnectLocked();
      return Fail(error, ErrorCode::kSocketError, "subscription failed: " + message);
    }
    return true;
  }

  void Disconnect() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    DisconnectLocked();
  }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return connected_ && IsLiveLocked();
  }

  bool SendRequest(const std::vector<uint8_t>& payload,
                   std::vector<Element>* replies, bool ack) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return SendRequestLocked(payload, replies, ack);
  }

  void SetNotificationCallback(NotificationCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    notification_cb_ = std::move(cb);
  }

  const DeviceDescriptor& descriptor() const { return descriptor_; }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  DeviceMetrics GetMetrics() const { return metrics_.Snapshot(); }

  // Runs on the notifier thread.
  void HandleNotification(const std::vector<uint8_t>& data) {
    metrics_.notifications_received.fetch_add(1);
    Error decode_error;
    auto notification = Decode(data, &decode_error);
    if (!notification.has_value()) {
      metrics_.parse_errors.fetch_add(1);
      internal::LogError("notification from " + descriptor_.address + ": " +
                             decode_error.message,
                         &config_);
      return;
    }
    NotificationCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = notification_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(*notification);
    } catch (const std::exception& ex) {
      metrics_.callback_exceptions.fetch_add(1);
      internal::LogError(std::string("NotificationCallback threw exception: ") + ex.what(),
                         &config_);
    } catch (...) {
      metrics_.callback_exceptions.fetch_add(1);
      internal::LogError("NotificationCallback threw unknown exception", &config_);
    }
  }

 private:
  bool Fail(Error* error, ErrorCode code, const std::string& message) {
    SetLastError(message);
    internal::LogError(message, &config_);
    return internal::SetError(error, code, message);
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
  }

  // Caller holds control_mutex_. False once the notifier has been stopped
  // since Connect().
  bool IsLiveLocked() const { return notifier_.RegistrationEpoch() == epoch_; }

  // Caller holds control_mutex_. Only a handler this session installed is
  // removed; another session may own the address.
  void DisconnectLocked() {
    if (!connected_) {
      return;
    }
    if (owns_handler_ && IsLiveLocked()) {
      notifier_.Unregister(descriptor_.address);
    }
    owns_handler_ = false;
    control_socket_.Close();
    connected_ = false;
  }

  // Caller holds control_mutex_. Replies are drained until one receive
  // times out; a timeout is the normal end of the exchange.
  bool SendRequestLocked(const std::vector<uint8_t>& payload,
                         std::vector<Element>* replies, bool ack) {
    if (replies) {
      replies->clear();
    }
    if (!connected_) {
      SetLastError("device " + descriptor_.address + " is not connected");
      return false;
    }
    const sockaddr_in target =
        internal::MakeSockaddr(descriptor_.address, *descriptor_.control_port);
    const ssize_t sent = control_socket_.SendTo(payload, target);
    if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
      metrics_.send_errors.fetch_add(1);
      std::ostringstream oss;
      if (sent < 0) {
        oss << "Failed to send request to " << descriptor_.address << ": "
            << std::strerror(errno);
      } else {
        oss << "Partial send of request to " << descriptor_.address << ": "
            << sent << " of " << payload.size() << " bytes";
      }
      SetLastError(oss.str());
      internal::LogError(oss.str(), &config_);
      return false;
    }
    metrics_.requests_sent.fetch_add(1);
    if (!ack) {
      return true;
    }

    std::vector<uint8_t> buffer;
    while (true) {
      sockaddr_in source{};
      const ReceiveStatus status =
          control_socket_.Receive(config_.max_datagram_size, &buffer, &source);
      if (status == ReceiveStatus::kTimeout) {
        return true;
      }
      if (status == ReceiveStatus::kError) {
        SetLastError(control_socket_.last_error());
        internal::LogError(control_socket_.last_error(), &config_);
        return false;
      }
      metrics_.replies_received.fetch_add(1);
      Error decode_error;
      auto reply = Decode(buffer, &decode_error);
      if (!reply.has_value()) {
        metrics_.parse_errors.fetch_add(1);
        internal::LogError("reply from " + internal::AddrToString(source) + ": " +
                               decode_error.message,
                           &config_);
        continue;
      }
      if (replies) {
        replies->push_back(std::move(*reply));
      }
    }
  }

  const DeviceDescriptor descriptor_;
  Notifier& notifier_;
  const Config config_;
  DeviceMetricsAtomic metrics_;

  mutable std::mutex control_mutex_;
  internal::UdpSocket control_socket_;
  bool connected_ = false;
  bool owns_handler_ = false;
  uint64_t epoch_ = 0;

  mutable std::mutex callback_mutex_;
  NotificationCallback notification_cb_;

  mutable std::mutex error_mutex_;
  std::string last_error_;
};

Device::Device(DeviceDescriptor descriptor, Notifier& notifier, Config config)
    : impl_(std::make_shared<Impl>(std::move(descriptor), notifier, std::move(config))) {}

Device::~Device() { impl_->Disconnect(); }

std::unique_ptr<Device> Device::Create(const std::string& address,
                                       const Element& advertisement,
                                       Notifier& notifier, Config config,
                                       Error* error) {
  auto descriptor = ParseAdvertisement(address, advertisement, error);
  if (!descriptor.has_value()) {
    return nullptr;
  }
  return std::make_unique<Device>(std::move(*descriptor), notifier, std::move(config));
}

bool Device::Connect(Error* error) { return impl_->Connect(error); }
void Device::Disconnect() { impl_->Disconnect(); }
bool Device::IsConnected() const { return impl_->IsConnected(); }

bool Device::SendRequest(const std::vector<uint8_t>& payload,
                         std::vector<Element>* replies, bool ack) {
  return impl_->SendRequest(payload, replies, ack);
}

bool Device::SendCommand(const std::string& command, const std::string& value,
                         std::vector<Element>* replies) {
  const Command control{command, {{"value", value}, {"ack", "yes"}}};
  return impl_->SendRequest(Encode(kMessageControl, {control}), replies, true);
}

bool Device::Subscribe(const std::vector<std::string>& events,
                       std::vector<Element>* replies) {
  return impl_->SendRequest(Encode(kMessageSubscription, EventCommands(events)),
                            replies, true);
}

bool Device::Unsubscribe(const std::vector<std::string>& events,
                         std::vector<Element>* replies) {
  return impl_->SendRequest(Encode(kMessageUnsubscribe, EventCommands(events)),
                            replies, true);
}

void Device::SetNotificationCallback(NotificationCallback cb) {
  impl_->SetNotificationCallback(std::move(cb));
}

const DeviceDescriptor& Device::descriptor() const { return impl_->descriptor(); }

std::string Device::GetLastError() const { return impl_->GetLastError(); }

DeviceMetrics Device::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef EMOTIVA_TESTING
namespace test {

void InjectNotification(Device& device, const std::vector<uint8_t>& data) {
  device.impl_->HandleNotification(data);
}

}  // namespace test
#endif

}  // namespace emotiva
