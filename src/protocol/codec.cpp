#include "protocol/codec.hpp"

#include "core/json_writer.hpp"

#include <utility>

namespace camhost::protocol {

namespace json = core::json;

namespace {

void WriteU32Be(std::uint8_t* out, std::uint32_t value) {
  out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFFU);
  out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFFU);
  out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFFU);
  out[3] = static_cast<std::uint8_t>(value & 0xFFU);
}

std::uint32_t ReadU32Be(const std::uint8_t* in) {
  return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
         (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}

} // namespace

std::array<std::uint8_t, kHeaderSize> EncodeHeader(const FrameHeader& header) {
  std::array<std::uint8_t, kHeaderSize> bytes{};
  WriteU32Be(bytes.data(), header.text_len);
  WriteU32Be(bytes.data() + 4, header.binary_len);
  return bytes;
}

bool DecodeHeader(const std::uint8_t* data, FrameHeader& header, std::string& error) {
  FrameHeader parsed;
  parsed.text_len = ReadU32Be(data);
  parsed.binary_len = ReadU32Be(data + 4);
  if (parsed.text_len == 0U) {
    error = "frame has an empty text section";
    return false;
  }
  if (parsed.text_len > kMaxTextBytes) {
    error = "frame text section of " + std::to_string(parsed.text_len) +
            " bytes exceeds the limit of " + std::to_string(kMaxTextBytes);
    return false;
  }
  if (parsed.binary_len > kMaxBinaryBytes) {
    error = "frame binary section of " + std::to_string(parsed.binary_len) +
            " bytes exceeds the limit of " + std::to_string(kMaxBinaryBytes);
    return false;
  }
  header = parsed;
  return true;
}

bool EncodeText(const Message& message, std::string& text, std::string& error) {
  if (message.tag != Tag::kImage && !message.binary.empty()) {
    error = std::string("'") + ToString(message.tag) + "' message cannot carry a binary payload";
    return false;
  }
  if (message.binary.size() > kMaxBinaryBytes) {
    error = "binary payload exceeds the frame limit";
    return false;
  }

  const json::Value envelope = json::MakeArray({json::MakeString(ToString(message.tag)),
                                                message.value});
  std::string encoded;
  if (!json::Serialize(envelope, encoded, error)) {
    error = std::string("failed to encode '") + ToString(message.tag) + "': " + error;
    return false;
  }
  if (encoded.size() > kMaxTextBytes) {
    error = "text section exceeds the frame limit";
    return false;
  }
  text = std::move(encoded);
  return true;
}

bool Decode(std::string_view text, std::vector<std::uint8_t> binary, Message& message,
            std::string& error) {
  json::Value envelope;
  std::string parse_error;
  if (!json::Parse(text, envelope, parse_error)) {
    error = "malformed message text: " + parse_error;
    return false;
  }
  if (envelope.type != json::Value::Type::kArray || envelope.array_value.size() != 2U ||
      envelope.array_value[0].type != json::Value::Type::kString) {
    error = "message text must be a (tag, value) pair";
    return false;
  }

  Tag tag = Tag::kEof;
  if (!ParseTag(envelope.array_value[0].string_value, tag)) {
    error = "unknown message tag '" + envelope.array_value[0].string_value + "'";
    return false;
  }
  if (tag != Tag::kImage && !binary.empty()) {
    error = std::string("'") + ToString(tag) + "' message arrived with a binary payload";
    return false;
  }

  Message decoded;
  decoded.tag = tag;
  decoded.value = std::move(envelope.array_value[1]);
  decoded.binary = std::move(binary);
  message = std::move(decoded);
  return true;
}

bool EncodeFrame(const Message& message, std::vector<std::uint8_t>& frame, std::string& error) {
  std::string text;
  if (!EncodeText(message, text, error)) {
    return false;
  }
  const auto header = EncodeHeader(FrameHeader{
      .text_len = static_cast<std::uint32_t>(text.size()),
      .binary_len = static_cast<std::uint32_t>(message.binary.size()),
  });

  std::vector<std::uint8_t> bytes;
  bytes.reserve(header.size() + text.size() + message.binary.size());
  bytes.insert(bytes.end(), header.begin(), header.end());
  bytes.insert(bytes.end(), text.begin(), text.end());
  bytes.insert(bytes.end(), message.binary.begin(), message.binary.end());
  frame = std::move(bytes);
  return true;
}

} // namespace camhost::protocol
