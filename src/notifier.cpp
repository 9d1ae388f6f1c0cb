#include "emotiva/emotiva.h"
#include "emotiva/test_hooks.h"
#include "net.h"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <unordered_map>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace emotiva {
namespace {

constexpr size_t kMaxEvents = 16;
constexpr auto kPollErrorBackoff = std::chrono::milliseconds(100);

struct NotifierMetricsAtomic {
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> datagrams_dispatched{0};
  std::atomic<uint64_t> datagrams_dropped{0};
  std::atomic<uint64_t> receive_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};

  NotifierMetrics Snapshot() const {
    NotifierMetrics snapshot;
    snapshot.datagrams_received = datagrams_received.load();
    snapshot.datagrams_dispatched = datagrams_dispatched.load();
    snapshot.datagrams_dropped = datagrams_dropped.load();
    snapshot.receive_errors = receive_errors.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

}  // namespace

struct Notifier::Impl {
#ifdef EMOTIVA_TESTING
  friend size_t test::GetHandlerCount(Notifier& notifier);
  friend size_t test::GetListeningSocketCount(Notifier& notifier);
#endif

  explicit Impl(Config config) : config_(std::move(config)) {}

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    if (thread_.joinable()) {
      // Stop() was called from a handler; finish it here.
      if (thread_.get_id() == std::this_thread::get_id()) {
        return FailStart("Start() called from a notification handler");
      }
      thread_.join();
      CloseAll();
    }
    std::string error;
    if (!config_.Validate(&error)) {
      return FailStart(error);
    }
    const int epoll_fd = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0) {
      return FailStart("epoll_create1() failed: " + std::string(std::strerror(errno)));
    }
    const int wake_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0) {
      ::close(epoll_fd);
      return FailStart("eventfd() failed: " + std::string(std::strerror(errno)));
    }
    std::vector<std::string> poll_errors;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      epoll_fd_ = epoll_fd;
      wake_fd_ = wake_fd;
      if (!AddToPoll(wake_fd_, &error)) {
        poll_errors.push_back(error);
      }
      // Sockets registered before Start().
      for (const auto& entry : sockets_by_fd_) {
        if (!AddToPoll(entry.first, &error)) {
          poll_errors.push_back(error);
        }
      }
    }
    for (const auto& message : poll_errors) {
      internal::LogError(message, &config_);
    }
    try {
      thread_ = std::thread([this, epoll_fd]() { PollLoop(epoll_fd); });
    } catch (const std::system_error& ex) {
      FailStart(std::string("thread start failed: ") + ex.what());
      CloseAll();
      return false;
    }
    return true;
  }

  void Stop() {
    const bool was_running = running_.exchange(false);
    if (!was_running && !thread_.joinable()) {
      return;
    }
    int wake_fd = -1;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      wake_fd = wake_fd_;
    }
    if (wake_fd >= 0) {
      const uint64_t one = 1;
      if (::write(wake_fd, &one, sizeof(one)) < 0) {
        // Not fatal: the loop sees running_ == false after one poll interval.
        internal::LogError("eventfd write failed: " + std::string(std::strerror(errno)),
                           &config_);
      }
    }
    if (thread_.joinable()) {
      // A handler cannot join its own thread. The loop exits once the
      // handler returns; Start() or the destructor joins it.
      if (thread_.get_id() == std::this_thread::get_id()) {
        return;
      }
      thread_.join();
    }
    CloseAll();
  }

  bool Register(const std::string& address, uint16_t port, Callback callback,
                Error* error, bool* installed) {
    if (installed) {
      *installed = false;
    }
    if (!callback) {
      return internal::SetError(error, ErrorCode::kInvalidConfig,
                                "callback must not be empty");
    }
    std::string failure;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (sockets_by_port_.find(port) == sockets_by_port_.end()) {
        auto socket = std::make_unique<internal::UdpSocket>();
        if (!socket->Open(port, config_.bind_address, false, true)) {
          failure = socket->last_error();
        } else if (epoll_fd_ >= 0 && !AddToPoll(socket->fd(), &failure)) {
          socket->Close();
        } else {
          sockets_by_fd_[socket->fd()] = socket.get();
          sockets_by_port_.emplace(port, std::move(socket));
        }
      }
      if (failure.empty()) {
        // An existing handler for this address is left in place.
        const bool inserted = handlers_.emplace(address, std::move(callback)).second;
        if (installed) {
          *installed = inserted;
        }
      } else {
        last_error_ = failure;
      }
    }
    if (!failure.empty()) {
      internal::LogError(failure, &config_);
      return internal::SetError(error, ErrorCode::kSocketError, failure);
    }
    return true;
  }

  void Unregister(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(address);
  }

  uint64_t RegistrationEpoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
  }

  bool IsRunning() const { return running_; }

  std::vector<uint16_t> ListeningPorts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint16_t> ports;
    ports.reserve(sockets_by_port_.size());
    for (const auto& entry : sockets_by_port_) {
      ports.push_back(entry.second->LocalPort());
    }
    return ports;
  }

  NotifierMetrics GetMetrics() const { return metrics_.Snapshot(); }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
  }

 private:
  bool FailStart(const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = message;
    }
    internal::LogError(message, &config_);
    running_ = false;
    return false;
  }

  // Caller holds mutex_.
  bool AddToPoll(int fd, std::string* error) {
    epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event) < 0) {
      *error = "epoll_ctl(ADD) failed: " + std::string(std::strerror(errno));
      return false;
    }
    return true;
  }

  void CloseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    sockets_by_fd_.clear();
    sockets_by_port_.clear();
    handlers_.clear();
    ++epoch_;
    if (wake_fd_ >= 0) {
      ::close(wake_fd_);
      wake_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
      ::close(epoll_fd_);
      epoll_fd_ = -1;
    }
  }

  // Readiness loop. Sockets are never removed while it runs, so the raw
  // pointer looked up under the lock stays valid for the recvfrom().
  void PollLoop(int epoll_fd) {
    std::array<epoll_event, kMaxEvents> events{};
    std::vector<uint8_t> buffer;
    const int timeout_ms = static_cast<int>(config_.poll_interval.count());
    while (running_) {
      const int ready = ::epoll_wait(epoll_fd, events.data(),
                                     static_cast<int>(events.size()), timeout_ms);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        internal::LogError("epoll_wait() failed: " + std::string(std::strerror(errno)),
                           &config_);
        std::this_thread::sleep_for(kPollErrorBackoff);
        continue;
      }
      for (int i = 0; i < ready && running_; ++i) {
        if ((events[i].events & (EPOLLIN | EPOLLERR)) == 0) {
          continue;
        }
        internal::UdpSocket* socket = nullptr;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          auto it = sockets_by_fd_.find(events[i].data.fd);
          if (it != sockets_by_fd_.end()) {
            socket = it->second;
          }
        }
        if (socket == nullptr) {
          // Wake-up from Stop().
          continue;
        }
        sockaddr_in source{};
        const ReceiveStatus status =
            socket->Receive(config_.max_datagram_size, &buffer, &source);
        if (status == ReceiveStatus::kTimeout) {
          continue;
        }
        if (status == ReceiveStatus::kError) {
          metrics_.receive_errors.fetch_add(1);
          std::ostringstream oss;
          oss << "notifier: receive on port " << socket->LocalPort()
              << " failed: " << socket->last_error();
          internal::LogError(oss.str(), &config_);
          continue;
        }
        metrics_.datagrams_received.fetch_add(1);
        Dispatch(internal::AddrToString(source), buffer);
      }
    }
  }

  // Called without mutex_ held so a handler may call Register().
  void Dispatch(const std::string& address, const std::vector<uint8_t>& data) {
    Callback cb_copy;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(address);
      if (it == handlers_.end()) {
        metrics_.datagrams_dropped.fetch_add(1);
        return;
      }
      cb_copy = it->second;
    }
    try {
      cb_copy(data);
      metrics_.datagrams_dispatched.fetch_add(1);
    } catch (const std::exception& ex) {
      metrics_.callback_exceptions.fetch_add(1);
      internal::LogError("notification handler for " + address +
                             " threw exception: " + ex.what(),
                         &config_);
    } catch (...) {
      metrics_.callback_exceptions.fetch_add(1);
      internal::LogError("notification handler for " + address +
                             " threw unknown exception",
                         &config_);
    }
  }

  Config config_;
  std::atomic<bool> running_{false};
  NotifierMetricsAtomic metrics_;

  // Guards everything below.
  mutable std::mutex mutex_;
  int epoll_fd_ = -1;
  int wake_fd_ = -1;
  std::unordered_map<uint16_t, std::unique_ptr<internal::UdpSocket>> sockets_by_port_;
  std::unordered_map<int, internal::UdpSocket*> sockets_by_fd_;
  std::unordered_map<std::string, Callback> handlers_;
  uint64_t epoch_ = 0;
  std::string last_error_;

  std::thread thread_;
};

Notifier::Notifier(Config config) : impl_(new Impl(std::move(config))) {}

Notifier::~Notifier() { impl_->Stop(); }

bool Notifier::Start() { return impl_->Start(); }
void Notifier::Stop() { impl_->Stop(); }
bool Notifier::IsRunning() const { return impl_->IsRunning(); }

bool Notifier::Register(const std::string& address, uint16_t port,
                        Callback callback, Error* error, bool* installed) {
  return impl_->Register(address, port, std::move(callback), error, installed);
}

void Notifier::Unregister(const std::string& address) {
  impl_->Unregister(address);
}

uint64_t Notifier::RegistrationEpoch() const { return impl_->RegistrationEpoch(); }

std::vector<uint16_t> Notifier::ListeningPorts() const {
  return impl_->ListeningPorts();
}

NotifierMetrics Notifier::GetMetrics() const { return impl_->GetMetrics(); }

std::string Notifier::GetLastError() const { return impl_->GetLastError(); }

#ifdef EMOTIVA_TESTING
namespace test {

size_t GetHandlerCount(Notifier& notifier) {
  std::lock_guard<std::mutex> lock(notifier.impl_->mutex_);
  return notifier.impl_->handlers_.size();
}

size_t GetListeningSocketCount(Notifier& notifier) {
  std::lock_guard<std::mutex> lock(notifier.impl_->mutex_);
  return notifier.impl_->sockets_by_port_.size();
}

}  // namespace test
#endif

}  // namespace emotiva
