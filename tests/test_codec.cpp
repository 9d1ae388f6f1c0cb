// Tests for message framing and response decoding.
#include "emotiva/emotiva.h"

#include <gtest/gtest.h>

#include <string>

namespace {

std::string ToString(const std::vector<uint8_t>& data) {
  return std::string(data.begin(), data.end());
}

std::vector<uint8_t> ToBytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST(CodecTest, EncodeControlCommandMatchesWireFormat) {
  const auto packet = emotiva::Encode(
      emotiva::kMessageControl, {{"volume", {{"value", "1"}, {"ack", "yes"}}}});
  EXPECT_EQ(ToString(packet),
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<emotivaControl><volume value=\"1\" ack=\"yes\" /></emotivaControl>");
}

TEST(CodecTest, EncodeStartsWithHeaderWithoutNewline) {
  const auto packet = emotiva::Encode(emotiva::kMessagePing, {});
  const std::string text = ToString(packet);
  const std::string header = emotiva::kXmlHeader;
  ASSERT_GT(text.size(), header.size());
  EXPECT_EQ(text.compare(0, header.size(), header), 0);
  EXPECT_EQ(text[header.size()], '<');
  EXPECT_EQ(text.substr(header.size()), "<emotivaPing />");
}

TEST(CodecTest, EncodeClosesOnlyEmptyElementsWithSpaceSlash) {
  const auto packet = emotiva::Encode(
      emotiva::kMessageSubscription, {{"power", {}}, {"volume", {}}});
  EXPECT_EQ(ToString(packet),
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<emotivaSubscription><power /><volume /></emotivaSubscription>");
}

TEST(CodecTest, EncodeKeepsRepeatedCommandsSeparate) {
  const auto packet = emotiva::Encode(
      emotiva::kMessageControl,
      {{"volume_up", {{"value", "1"}}}, {"volume_up", {{"value", "1"}}}});
  auto decoded = emotiva::Decode(packet);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->children.size(), 2u);
  EXPECT_EQ(decoded->children[0].name, "volume_up");
  EXPECT_EQ(decoded->children[1].name, "volume_up");
}

TEST(CodecTest, RoundTripPreservesCommandsAndParameters) {
  const std::vector<emotiva::Command> commands = {
      {"power_on", {{"value", "0"}, {"ack", "yes"}}},
      {"source_2", {}},
      {"mode", {{"value", "stereo & more"}}},
  };
  auto decoded = emotiva::Decode(emotiva::Encode(emotiva::kMessageControl, commands));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->name, "emotivaControl");
  ASSERT_EQ(decoded->children.size(), commands.size());
  for (size_t i = 0; i < commands.size(); ++i) {
    const auto& element = decoded->children[i];
    EXPECT_EQ(element.name, commands[i].name);
    ASSERT_EQ(element.attributes.size(), commands[i].params.size());
    for (const auto& param : commands[i].params) {
      EXPECT_EQ(element.GetAttribute(param.first), param.second);
    }
  }
}

TEST(CodecTest, DecodeMultiLineIndentedPayload) {
  const std::string payload =
      "<?xml version=\"1.0\"?>\n"
      "<emotivaTransponder>\n"
      "    <model>XMC-1</model>\n"
      "    <name>Living Room</name>\n"
      "    <control>\n"
      "        <version>2.0</version>\n"
      "        <controlPort>7002</controlPort>\n"
      "    </control>\n"
      "</emotivaTransponder>\n";
  auto decoded = emotiva::Decode(ToBytes(payload));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->name, "emotivaTransponder");
  EXPECT_EQ(decoded->ChildText("model"), "XMC-1");
  EXPECT_EQ(decoded->ChildText("name"), "Living Room");
  const emotiva::Element* control = decoded->FindChild("control");
  ASSERT_NE(control, nullptr);
  EXPECT_EQ(control->ChildText("controlPort"), "7002");
}

TEST(CodecTest, DecodeHandlesCarriageReturns) {
  auto decoded = emotiva::Decode(ToBytes(
      "<emotivaAck>\r\n  <power status=\"ack\"/>\r\n</emotivaAck>\r\n"));
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->children.size(), 1u);
  EXPECT_EQ(decoded->children[0].GetAttribute("status"), "ack");
}

TEST(CodecTest, DecodeRejectsMalformedPayload) {
  emotiva::Error error;
  auto decoded = emotiva::Decode(ToBytes("<emotivaAck>\n  <power>\n"), &error);
  EXPECT_FALSE(decoded.has_value());
  EXPECT_EQ(error.code, emotiva::ErrorCode::kMalformedResponse);
  EXPECT_FALSE(error.message.empty());
}

TEST(CodecTest, DecodeRejectsEmptyPayload) {
  emotiva::Error error;
  EXPECT_FALSE(emotiva::Decode(ToBytes("  \n \n"), &error).has_value());
  EXPECT_EQ(error.code, emotiva::ErrorCode::kMalformedResponse);

  EXPECT_FALSE(emotiva::Decode(std::vector<uint8_t>{}).has_value());
}

TEST(CodecTest, DecodeToleratesUnknownElementsAndAttributes) {
  auto decoded = emotiva::Decode(ToBytes(
      "<emotivaNotify sequence=\"12\" future=\"x\">"
      "<property name=\"volume\" value=\"-40.0\" visible=\"true\" extra=\"1\"/>"
      "<somethingNew><nested/></somethingNew>"
      "</emotivaNotify>"));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->GetAttribute("sequence"), "12");
  ASSERT_EQ(decoded->children.size(), 2u);
  EXPECT_EQ(decoded->children[0].GetAttribute("value"), "-40.0");
  EXPECT_EQ(decoded->children[1].children.size(), 1u);
  EXPECT_FALSE(decoded->GetAttribute("missing").has_value());
  EXPECT_EQ(decoded->FindChild("missing"), nullptr);
}
