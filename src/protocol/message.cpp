#include "protocol/message.hpp"

#include "protocol/codec.hpp"

#include <array>
#include <limits>
#include <utility>

namespace camhost::protocol {

namespace json = core::json;

namespace {

struct TagName {
  Tag tag;
  std::string_view name;
};

constexpr std::array<TagName, 13> kTagNames = {{
    {Tag::kOpenCam, "open_cam"},
    {Tag::kCloseCam, "close_cam"},
    {Tag::kPlay, "play"},
    {Tag::kStop, "stop"},
    {Tag::kSetting, "setting"},
    {Tag::kSerials, "serials"},
    {Tag::kEof, "eof"},
    {Tag::kCamOpen, "cam_open"},
    {Tag::kCamClosed, "cam_closed"},
    {Tag::kPlaying, "playing"},
    {Tag::kSettings, "settings"},
    {Tag::kImage, "image"},
    {Tag::kException, "exception"},
}};

bool ExpectTag(const Message& message, Tag expected, std::string& error) {
  if (message.tag != expected) {
    error = std::string("expected '") + ToString(expected) + "' message, got '" +
            ToString(message.tag) + "'";
    return false;
  }
  return true;
}

bool ReadUnsigned(const json::Value& value, std::uint64_t max, std::uint64_t& out) {
  if (value.type != json::Value::Type::kInteger || value.integer_value < 0 ||
      static_cast<std::uint64_t>(value.integer_value) > max) {
    return false;
  }
  out = static_cast<std::uint64_t>(value.integer_value);
  return true;
}

} // namespace

const char* ToString(Tag tag) {
  for (const TagName& entry : kTagNames) {
    if (entry.tag == tag) {
      return entry.name.data();
    }
  }
  return "unknown";
}

bool ParseTag(std::string_view raw, Tag& tag) {
  for (const TagName& entry : kTagNames) {
    if (entry.name == raw) {
      tag = entry.tag;
      return true;
    }
  }
  return false;
}

bool IsClientRequest(Tag tag) {
  switch (tag) {
  case Tag::kOpenCam:
  case Tag::kCloseCam:
  case Tag::kPlay:
  case Tag::kStop:
  case Tag::kSetting:
  case Tag::kSerials:
  case Tag::kEof:
    return true;
  default:
    return false;
  }
}

bool IsServerEvent(Tag tag) {
  switch (tag) {
  case Tag::kCamOpen:
  case Tag::kCamClosed:
  case Tag::kPlaying:
  case Tag::kSettings:
  case Tag::kSetting:
  case Tag::kSerials:
  case Tag::kImage:
  case Tag::kException:
    return true;
  default:
    return false;
  }
}

bool IsSessionScoped(Tag tag) {
  return tag == Tag::kCloseCam || tag == Tag::kPlay || tag == Tag::kStop ||
         tag == Tag::kSetting;
}

Message MakeMessage(Tag tag, json::Value value) {
  Message message;
  message.tag = tag;
  message.value = std::move(value);
  return message;
}

Message MakeOpenCam(std::string serial) {
  return MakeMessage(Tag::kOpenCam, json::MakeString(std::move(serial)));
}

Message MakeSettingRequest(std::string name, json::Value value) {
  return MakeMessage(Tag::kSetting,
                     json::MakeArray({json::MakeString(std::move(name)), std::move(value)}));
}

Message MakePlaying(bool playing) {
  return MakeMessage(Tag::kPlaying, json::MakeBool(playing));
}

Message MakeSerials(const std::vector<std::string>& serials) {
  json::Value::Array items;
  items.reserve(serials.size());
  for (const std::string& serial : serials) {
    items.push_back(json::MakeString(serial));
  }
  return MakeMessage(Tag::kSerials, json::MakeArray(std::move(items)));
}

Message MakeException(std::string message, std::string trace) {
  return MakeMessage(Tag::kException, json::MakeArray({json::MakeString(std::move(message)),
                                                       json::MakeString(std::move(trace))}));
}

Message MakeImageMessage(core::schema::FrameEnvelope frame) {
  json::Value::Array metadata;
  metadata.push_back(json::MakeString(core::schema::ToString(frame.pixel_format)));
  metadata.push_back(json::MakeArray({json::MakeInteger(frame.width),
                                      json::MakeInteger(frame.height)}));
  metadata.push_back(json::MakeInteger(static_cast<std::int64_t>(frame.frame_index)));
  metadata.push_back(json::MakeInteger(frame.queued_count));
  metadata.push_back(json::MakeNumber(frame.capture_time));

  Message message = MakeMessage(Tag::kImage, json::MakeArray(std::move(metadata)));
  message.binary = std::move(frame.pixel_bytes);
  return message;
}

bool ParseOpenCam(const Message& message, std::string& serial, std::string& error) {
  if (!ExpectTag(message, Tag::kOpenCam, error)) {
    return false;
  }
  if (message.value.type != json::Value::Type::kString) {
    error = "open_cam expects a serial string";
    return false;
  }
  serial = message.value.string_value;
  return true;
}

bool ParseSettingRequest(const Message& message, std::string& name, json::Value& value,
                         std::string& error) {
  if (!ExpectTag(message, Tag::kSetting, error)) {
    return false;
  }
  const json::Value& payload = message.value;
  if (payload.type != json::Value::Type::kArray || payload.array_value.size() != 2U ||
      payload.array_value[0].type != json::Value::Type::kString) {
    error = "setting expects a (name, value) pair";
    return false;
  }
  name = payload.array_value[0].string_value;
  value = payload.array_value[1];
  return true;
}

bool ParsePlaying(const Message& message, bool& playing, std::string& error) {
  if (!ExpectTag(message, Tag::kPlaying, error)) {
    return false;
  }
  if (message.value.type != json::Value::Type::kBool) {
    error = "playing expects a bool";
    return false;
  }
  playing = message.value.bool_value;
  return true;
}

bool ParseSerials(const Message& message, std::vector<std::string>& serials, std::string& error) {
  if (!ExpectTag(message, Tag::kSerials, error)) {
    return false;
  }
  if (message.value.type != json::Value::Type::kArray) {
    error = "serials expects a list of strings";
    return false;
  }
  std::vector<std::string> parsed;
  for (const json::Value& item : message.value.array_value) {
    if (item.type != json::Value::Type::kString) {
      error = "serials expects a list of strings";
      return false;
    }
    parsed.push_back(item.string_value);
  }
  serials = std::move(parsed);
  return true;
}

bool ParseException(const Message& message, std::string& text, std::string& trace,
                    std::string& error) {
  if (!ExpectTag(message, Tag::kException, error)) {
    return false;
  }
  const json::Value& payload = message.value;
  if (payload.type != json::Value::Type::kArray || payload.array_value.size() != 2U ||
      payload.array_value[0].type != json::Value::Type::kString ||
      payload.array_value[1].type != json::Value::Type::kString) {
    error = "exception expects a (message, trace) pair";
    return false;
  }
  text = payload.array_value[0].string_value;
  trace = payload.array_value[1].string_value;
  return true;
}

bool ParseImageMessage(const Message& message, core::schema::FrameEnvelope& frame,
                       std::string& error) {
  if (!ExpectTag(message, Tag::kImage, error)) {
    return false;
  }
  const json::Value& payload = message.value;
  if (payload.type != json::Value::Type::kArray || payload.array_value.size() != 5U) {
    error = "image metadata must be (format, (w, h), index, queued, time)";
    return false;
  }
  const json::Value::Array& items = payload.array_value;

  core::schema::FrameEnvelope parsed;
  if (items[0].type != json::Value::Type::kString ||
      !core::schema::ParsePixelFormat(items[0].string_value, parsed.pixel_format)) {
    error = "image metadata has an unknown pixel format";
    return false;
  }

  constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();
  std::uint64_t width = 0;
  std::uint64_t height = 0;
  if (items[1].type != json::Value::Type::kArray || items[1].array_value.size() != 2U ||
      !ReadUnsigned(items[1].array_value[0], kMaxU32, width) ||
      !ReadUnsigned(items[1].array_value[1], kMaxU32, height)) {
    error = "image metadata has an invalid size";
    return false;
  }

  std::uint64_t queued = 0;
  if (!ReadUnsigned(items[2], std::numeric_limits<std::uint64_t>::max(), parsed.frame_index) ||
      !ReadUnsigned(items[3], kMaxU32, queued) || !items[4].IsNumeric()) {
    error = "image metadata has an invalid counter or timestamp";
    return false;
  }

  parsed.width = static_cast<std::uint32_t>(width);
  parsed.height = static_cast<std::uint32_t>(height);
  parsed.queued_count = static_cast<std::uint32_t>(queued);
  parsed.capture_time = items[4].AsDouble();

  // Bounded before multiplying so a forged size cannot wrap to the payload.
  const std::uint64_t bytes_per_pixel = core::schema::BytesPerPixel(parsed.pixel_format);
  if (width != 0U && height != 0U && width > kMaxBinaryBytes / height / bytes_per_pixel) {
    error = "image size " + std::to_string(width) + "x" + std::to_string(height) +
            " exceeds the frame limit";
    return false;
  }
  const std::uint64_t expected_bytes = width * height * bytes_per_pixel;
  if (expected_bytes != message.binary.size()) {
    error = "image payload holds " + std::to_string(message.binary.size()) +
            " bytes, expected " + std::to_string(expected_bytes);
    return false;
  }
  parsed.pixel_bytes = message.binary;
  frame = std::move(parsed);
  return true;
}

} // namespace camhost::protocol
