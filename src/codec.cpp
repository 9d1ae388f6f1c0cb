#include "emotiva/emotiva.h"
#include "net.h"

#include <cstring>

#include <tinyxml2.h>

namespace emotiva {
namespace {

constexpr char kWhitespace[] = " \t\r\f\v";

std::string Trim(const std::string& value) {
  const size_t begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) {
    return {};
  }
  const size_t end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}

// Devices send indented multi-line documents that tinyxml2 would otherwise
// keep as whitespace text. Trim every line and join them back together.
std::string JoinTrimmedLines(const uint8_t* data, size_t length) {
  const std::string raw(reinterpret_cast<const char*>(data), length);
  std::string joined;
  joined.reserve(raw.size());
  size_t start = 0;
  while (start <= raw.size()) {
    size_t end = raw.find('\n', start);
    if (end == std::string::npos) {
      end = raw.size();
    }
    joined += Trim(raw.substr(start, end - start));
    start = end + 1;
  }
  return joined;
}

Element ConvertElement(const tinyxml2::XMLElement* xml) {
  Element out;
  out.name = xml->Name();
  for (const tinyxml2::XMLAttribute* attr = xml->FirstAttribute(); attr != nullptr;
       attr = attr->Next()) {
    out.attributes.emplace_back(attr->Name(), attr->Value());
  }
  if (const char* text = xml->GetText()) {
    out.text = Trim(text);
  }
  for (const tinyxml2::XMLElement* child = xml->FirstChildElement(); child != nullptr;
       child = child->NextSiblingElement()) {
    out.children.push_back(ConvertElement(child));
  }
  return out;
}

// Compact printer that closes empty elements as "<name ... />", the form
// devices expect on the wire.
class WirePrinter : public tinyxml2::XMLPrinter {
 public:
  WirePrinter() : tinyxml2::XMLPrinter(nullptr, true) {}

  void CloseElement(bool compact_mode) override {
    if (_elementJustOpened) {
      Putc(' ');
    }
    tinyxml2::XMLPrinter::CloseElement(compact_mode);
  }
};

}  // namespace

const Element* Element::FindChild(const std::string& child_name) const {
  for (const auto& child : children) {
    if (child.name == child_name) {
      return &child;
    }
  }
  return nullptr;
}

std::optional<std::string> Element::GetAttribute(const std::string& key) const {
  for (const auto& attr : attributes) {
    if (attr.first == key) {
      return attr.second;
    }
  }
  return std::nullopt;
}

std::optional<std::string> Element::ChildText(const std::string& child_name) const {
  const Element* child = FindChild(child_name);
  if (child == nullptr) {
    return std::nullopt;
  }
  return child->text;
}

std::vector<uint8_t> Encode(const std::string& message_type,
                            const std::vector<Command>& commands) {
  tinyxml2::XMLDocument doc;
  tinyxml2::XMLElement* root = doc.NewElement(message_type.c_str());
  doc.InsertEndChild(root);
  for (const auto& command : commands) {
    tinyxml2::XMLElement* element = doc.NewElement(command.name.c_str());
    for (const auto& param : command.params) {
      element->SetAttribute(param.first.c_str(), param.second.c_str());
    }
    root->InsertEndChild(element);
  }

  WirePrinter printer;
  doc.Print(&printer);

  std::vector<uint8_t> packet;
  const size_t header_size = std::strlen(kXmlHeader);
  // CStrSize() counts the terminating null.
  const size_t body_size = static_cast<size_t>(printer.CStrSize() - 1);
  packet.reserve(header_size + body_size);
  packet.insert(packet.end(), kXmlHeader, kXmlHeader + header_size);
  packet.insert(packet.end(), printer.CStr(), printer.CStr() + body_size);
  return packet;
}

std::optional<Element> Decode(const uint8_t* data, size_t length, Error* error) {
  const std::string joined =
      (data == nullptr || length == 0) ? std::string() : JoinTrimmedLines(data, length);
  if (joined.empty()) {
    internal::SetError(error, ErrorCode::kMalformedResponse, "empty payload");
    return std::nullopt;
  }
  tinyxml2::XMLDocument doc;
  if (doc.Parse(joined.data(), joined.size()) != tinyxml2::XML_SUCCESS) {
    internal::SetError(error, ErrorCode::kMalformedResponse,
                       std::string("xml parse failed: ") + doc.ErrorStr());
    return std::nullopt;
  }
  const tinyxml2::XMLElement* root = doc.RootElement();
  if (root == nullptr) {
    internal::SetError(error, ErrorCode::kMalformedResponse, "no root element");
    return std::nullopt;
  }
  return ConvertElement(root);
}

std::optional<Element> Decode(const std::vector<uint8_t>& data, Error* error) {
  return Decode(data.data(), data.size(), error);
}

}  // namespace emotiva
