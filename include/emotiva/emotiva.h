#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace emotiva {

class Notifier;
class Device;

#ifdef EMOTIVA_TESTING
namespace test {
size_t GetHandlerCount(Notifier& notifier);
size_t GetListeningSocketCount(Notifier& notifier);
void InjectNotification(Device& device, const std::vector<uint8_t>& data);
}  // namespace test
#endif

/**
 * Well-known discovery UDP ports.
 */
constexpr uint16_t kDiscoverRequestPort = 7000;
constexpr uint16_t kDiscoverResponsePort = 7001;

/**
 * Every outbound message starts with this declaration, with no trailing newline.
 */
constexpr char kXmlHeader[] = "<?xml version=\"1.0\" encoding=\"utf-8\"?>";

/**
 * Root element names used by the control protocol.
 */
constexpr char kMessagePing[] = "emotivaPing";
constexpr char kMessageControl[] = "emotivaControl";
constexpr char kMessageSubscription[] = "emotivaSubscription";
constexpr char kMessageUnsubscribe[] = "emotivaUnsubscribe";
constexpr char kMessageUpdate[] = "emotivaUpdate";

/// Default value for missing name/model fields in an advertisement.
constexpr char kUnknown[] = "Unknown";

/**
 * Events subscribed to on Connect().
 */
constexpr std::array<const char*, 17> kNotifyEvents = {
    "power",       "zone2_power",     "source",      "mode",
    "volume",      "audio_input",     "audio_bitstream",
    "video_input", "video_format",    "input_1",     "input_2",
    "input_3",     "input_4",         "input_5",     "input_6",
    "input_7",     "input_8",
};

enum class ErrorCode {
  kOk,
  kInvalidAdvertisement,
  kMalformedResponse,
  kSocketError,
  kInvalidConfig,
  kNotConnected,
};

/**
 * Failure description filled in by operations that take an Error* argument.
 */
struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;
};

/**
 * Outcome of a single bounded receive.
 */
enum class ReceiveStatus {
  kData,
  kTimeout,
  kError,
};

using Attribute = std::pair<std::string, std::string>;

/**
 * One command of an outbound message: a child element with attributes.
 */
struct Command {
  std::string name;
  std::vector<Attribute> params;
};

/**
 * Decoded XML element. Attribute and child order follow the document.
 */
struct Element {
  std::string name;
  std::vector<Attribute> attributes;
  /// Trimmed text content, empty if none.
  std::string text;
  std::vector<Element> children;

  /// First child element with the given name, or nullptr.
  const Element* FindChild(const std::string& child_name) const;
  /// Attribute value by key, if present.
  std::optional<std::string> GetAttribute(const std::string& key) const;
  /// Text of the first child with the given name, if present.
  std::optional<std::string> ChildText(const std::string& child_name) const;
};

/**
 * Build a framed message: kXmlHeader followed by
 * <message_type><cmd attr="..."/>...</message_type>.
 */
std::vector<uint8_t> Encode(const std::string& message_type,
                            const std::vector<Command>& commands);

/**
 * Decode a datagram. Each line is trimmed and the lines are joined before
 * parsing. Fails with kMalformedResponse if the result is not XML.
 */
std::optional<Element> Decode(const uint8_t* data, size_t length,
                              Error* error = nullptr);
std::optional<Element> Decode(const std::vector<uint8_t>& data,
                              Error* error = nullptr);

/**
 * Device information parsed from a discovery advertisement.
 */
struct DeviceDescriptor {
  /// IPv4 address the advertisement came from.
  std::string address;
  std::string name = kUnknown;
  std::string model = kUnknown;
  /// Protocol version from <control><version>.
  std::optional<std::string> protocol_version;
  std::optional<uint16_t> control_port;
  std::optional<uint16_t> notify_port;
  std::optional<uint16_t> info_port;
  /// Setup port is TCP, unused by this client.
  std::optional<uint16_t> setup_port_tcp;

  /// True if both control and notify ports are known.
  bool IsUsable() const;
};

/**
 * Parse an advertisement tree. Fails with kInvalidAdvertisement if the
 * control or notify port is missing.
 */
std::optional<DeviceDescriptor> ParseAdvertisement(const std::string& address,
                                                   const Element& advertisement,
                                                   Error* error = nullptr);

/**
 * Client configuration shared by discovery, devices and the notifier.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Local bind address for sockets (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Destination for the discovery ping.
  std::string broadcast_address = "255.255.255.255";
  uint16_t discover_request_port = kDiscoverRequestPort;
  uint16_t discover_response_port = kDiscoverResponsePort;

  /// Discovery ends once no response arrives for this long.
  std::chrono::milliseconds discover_wait{500};
  /// Receive timeout on a device control socket.
  std::chrono::milliseconds control_timeout{500};
  /// Upper bound on a single readiness poll in the notifier loop.
  std::chrono::milliseconds poll_interval{1000};

  /// Receive buffer size for all sockets.
  size_t max_datagram_size = 2048;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * A device that answered the discovery ping.
 */
struct DiscoveredDevice {
  std::string address;
  Element advertisement;
};

/**
 * Broadcast a ping and collect responses until none arrive for
 * config.discover_wait. Undecodable responses are logged and skipped.
 *
 * @return false only if the sockets could not be set up or the ping failed.
 */
bool Discover(const Config& config, std::vector<DiscoveredDevice>* out,
              Error* error = nullptr);

/// Discover() followed by ParseAdvertisement(); unusable devices are skipped.
bool DiscoverDevices(const Config& config, std::vector<DeviceDescriptor>* out,
                     Error* error = nullptr);

struct NotifierMetrics {
  uint64_t datagrams_received = 0;
  uint64_t datagrams_dispatched = 0;
  uint64_t datagrams_dropped = 0;
  uint64_t receive_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Shared notification listener. Owns one UDP socket per listening port and
 * routes each datagram to the handler registered for its source address.
 * Handlers run on the notifier thread, outside the registry lock.
 */
class Notifier {
 public:
  using Callback = std::function<void(const std::vector<uint8_t>&)>;

  explicit Notifier(Config config = {});
  /// Stop the dispatch thread and close sockets.
  ~Notifier();

  Notifier(const Notifier&) = delete;
  Notifier& operator=(const Notifier&) = delete;

  /// Start the dispatch thread.
  bool Start();
  /**
   * Stop the dispatch thread, close all sockets and clear registrations.
   * Devices connected before Stop() report IsConnected() == false and must
   * Connect() again. When called from a handler the thread is joined later,
   * by the next Start() or the destructor.
   */
  void Stop();
  bool IsRunning() const;

  /**
   * Listen on port (once per port) and route datagrams from address to
   * callback. If address already has a handler it is kept and callback is
   * discarded; *installed tells the two cases apart.
   *
   * @return false if a socket for port could not be opened.
   */
  bool Register(const std::string& address, uint16_t port, Callback callback,
                Error* error = nullptr, bool* installed = nullptr);
  /// Remove the handler for address. Listening sockets stay open.
  void Unregister(const std::string& address);

  /// Incremented by every Stop(); registrations from older epochs are gone.
  uint64_t RegistrationEpoch() const;

  std::vector<uint16_t> ListeningPorts() const;
  NotifierMetrics GetMetrics() const;
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef EMOTIVA_TESTING
  friend size_t test::GetHandlerCount(Notifier& notifier);
  friend size_t test::GetListeningSocketCount(Notifier& notifier);
#endif
};

struct DeviceMetrics {
  uint64_t requests_sent = 0;
  uint64_t send_errors = 0;
  uint64_t replies_received = 0;
  uint64_t parse_errors = 0;
  uint64_t notifications_received = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Control session with a single device.
 */
class Device {
 public:
  using NotificationCallback = std::function<void(const Element&)>;

  Device(DeviceDescriptor descriptor, Notifier& notifier, Config config = {});
  /// Disconnect and unregister from the notifier.
  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  /// Build a device from a discovery advertisement, or nullptr if unusable.
  static std::unique_ptr<Device> Create(const std::string& address,
                                        const Element& advertisement,
                                        Notifier& notifier,
                                        Config config = {},
                                        Error* error = nullptr);

  /**
   * Bind the control socket, register for notifications and subscribe to
   * kNotifyEvents.
   */
  bool Connect(Error* error = nullptr);
  void Disconnect();
  /// False after Disconnect() or once the notifier has been stopped.
  bool IsConnected() const;

  /**
   * Send a framed request and collect every reply that arrives before a
   * receive times out. With ack == false nothing is read back.
   *
   * @return false if not connected or the socket failed.
   */
  bool SendRequest(const std::vector<uint8_t>& payload,
                   std::vector<Element>* replies = nullptr, bool ack = true);

  /// Send <emotivaControl><command value="..." ack="yes"/></emotivaControl>.
  bool SendCommand(const std::string& command, const std::string& value,
                   std::vector<Element>* replies = nullptr);

  bool Subscribe(const std::vector<std::string>& events,
                 std::vector<Element>* replies = nullptr);
  bool Unsubscribe(const std::vector<std::string>& events,
                   std::vector<Element>* replies = nullptr);

  /// Set callback invoked with each decoded notification.
  void SetNotificationCallback(NotificationCallback cb);

  const DeviceDescriptor& descriptor() const;
  std::string GetLastError() const;
  DeviceMetrics GetMetrics() const;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;

#ifdef EMOTIVA_TESTING
  friend void test::InjectNotification(Device& device,
                                       const std::vector<uint8_t>& data);
#endif
};

}  // namespace emotiva
