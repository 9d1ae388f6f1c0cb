// Tests for broadcast discovery over loopback.
#include "emotiva/emotiva.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>

using emotiva_test::Bytes;
using emotiva_test::LoopbackSocket;

namespace {

std::string Advertisement(const std::string& name, bool with_notify_port) {
  std::string text =
      "<?xml version=\"1.0\"?>\n"
      "<emotivaTransponder>\n"
      "  <model>XMC-1</model>\n"
      "  <name>" + name + "</name>\n"
      "  <control>\n"
      "    <version>2.0</version>\n"
      "    <controlPort>7002</controlPort>\n";
  if (with_notify_port) {
    text += "    <notifyPort>7003</notifyPort>\n";
  }
  text +=
      "  </control>\n"
      "</emotivaTransponder>\n";
  return text;
}

class DiscoveryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.broadcast_address = "127.0.0.1";
    config_.discover_request_port = emotiva_test::FindFreeUdpPort();
    config_.discover_response_port = emotiva_test::FindFreeUdpPort();
    config_.discover_wait = std::chrono::milliseconds(150);
    config_.log_callback = [this](const std::string& line) {
      std::lock_guard<std::mutex> lock(log_mutex_);
      log_lines_.push_back(line);
    };
  }

  // Answer the first ping from each of the given source addresses.
  std::thread StartResponders(std::vector<std::pair<std::string, std::vector<std::string>>> replies) {
    auto listener = std::make_shared<LoopbackSocket>();
    EXPECT_TRUE(listener->Open("127.0.0.1", config_.discover_request_port));
    const uint16_t response_port = config_.discover_response_port;
    return std::thread([this, listener, replies, response_port]() {
      std::vector<uint8_t> ping;
      if (!listener->Receive(std::chrono::milliseconds(2000), &ping)) {
        return;
      }
      ping_ = emotiva_test::AsString(ping);
      for (const auto& source : replies) {
        LoopbackSocket sender;
        if (!sender.Open(source.first, 0)) {
          continue;
        }
        for (const auto& payload : source.second) {
          sender.SendTo(Bytes(payload), "127.0.0.1", response_port);
        }
      }
    });
  }

  size_t LogCount() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return log_lines_.size();
  }

  emotiva::Config config_;
  std::string ping_;
  std::mutex log_mutex_;
  std::vector<std::string> log_lines_;
};

}  // namespace

TEST_F(DiscoveryTest, NoDevicesReturnsEmptyAfterWait) {
  std::vector<emotiva::DiscoveredDevice> devices;
  emotiva::Error error;
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(emotiva::Discover(config_, &devices, &error)) << error.message;
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(devices.empty());
  EXPECT_GE(elapsed, std::chrono::milliseconds(120));
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(DiscoveryTest, CollectsResponsesInArrivalOrderAndSkipsGarbage) {
  std::thread responder = StartResponders({
      {"127.0.0.2", {"<emotivaTransponder><name>broken", Advertisement("Theater", true)}},
      {"127.0.0.3", {Advertisement("Den", true)}},
  });

  std::vector<emotiva::DiscoveredDevice> devices;
  emotiva::Error error;
  const bool ok = emotiva::Discover(config_, &devices, &error);
  responder.join();
  ASSERT_TRUE(ok) << error.message;

  auto ping = emotiva::Decode(Bytes(ping_));
  ASSERT_TRUE(ping.has_value());
  EXPECT_EQ(ping->name, emotiva::kMessagePing);
  EXPECT_TRUE(ping->children.empty());

  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].address, "127.0.0.2");
  EXPECT_EQ(devices[0].advertisement.ChildText("name"), "Theater");
  EXPECT_EQ(devices[1].address, "127.0.0.3");
  EXPECT_EQ(devices[1].advertisement.ChildText("name"), "Den");
  EXPECT_EQ(LogCount(), 1u);
}

TEST_F(DiscoveryTest, DiscoverDevicesSkipsUnusableAdvertisements) {
  std::thread responder = StartResponders({
      {"127.0.0.2", {Advertisement("NoNotify", false)}},
      {"127.0.0.3", {Advertisement("Den", true)}},
  });

  std::vector<emotiva::DeviceDescriptor> descriptors;
  const bool ok = emotiva::DiscoverDevices(config_, &descriptors);
  responder.join();
  ASSERT_TRUE(ok);

  ASSERT_EQ(descriptors.size(), 1u);
  EXPECT_EQ(descriptors[0].address, "127.0.0.3");
  EXPECT_EQ(descriptors[0].name, "Den");
  EXPECT_EQ(descriptors[0].model, "XMC-1");
  EXPECT_EQ(descriptors[0].control_port, 7002);
  EXPECT_EQ(descriptors[0].notify_port, 7003);
}

TEST_F(DiscoveryTest, InvalidConfigIsRejected) {
  config_.broadcast_address = "not-an-address";
  std::vector<emotiva::DiscoveredDevice> devices;
  emotiva::Error error;
  EXPECT_FALSE(emotiva::Discover(config_, &devices, &error));
  EXPECT_EQ(error.code, emotiva::ErrorCode::kInvalidConfig);
  EXPECT_NE(error.message.find("broadcast_address"), std::string::npos);
}

TEST_F(DiscoveryTest, BusyResponsePortIsSocketError) {
  // A non-reusable socket holding the response port makes bind() fail.
  const int blocker = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(blocker, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.discover_response_port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  ASSERT_EQ(::bind(blocker, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

  std::vector<emotiva::DiscoveredDevice> devices;
  emotiva::Error error;
  EXPECT_FALSE(emotiva::Discover(config_, &devices, &error));
  EXPECT_EQ(error.code, emotiva::ErrorCode::kSocketError);
  ::close(blocker);
}
