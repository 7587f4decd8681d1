#pragma once

#include "core/json_dom.hpp"
#include "core/schema/frame_envelope.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camhost::protocol {

// Every tag that may appear on the wire. `kSetting` and `kSerials` travel in
// both directions; the others are one-directional.
enum class Tag {
  // client -> server
  kOpenCam,
  kCloseCam,
  kPlay,
  kStop,
  kSetting,
  kSerials,
  kEof,
  // server -> client
  kCamOpen,
  kCamClosed,
  kPlaying,
  kSettings,
  kImage,
  kException,
};

const char* ToString(Tag tag);
bool ParseTag(std::string_view raw, Tag& tag);

bool IsClientRequest(Tag tag);
bool IsServerEvent(Tag tag);

// Requests that only make sense while a camera session is open.
bool IsSessionScoped(Tag tag);

// One protocol message. `binary` is the out-of-band payload and is only
// populated for `image`; `value` then holds the image metadata tuple.
struct Message {
  Tag tag = Tag::kEof;
  core::json::Value value;
  std::vector<std::uint8_t> binary;
};

Message MakeMessage(Tag tag, core::json::Value value = core::json::MakeNull());

Message MakeOpenCam(std::string serial);
Message MakeSettingRequest(std::string name, core::json::Value value);
Message MakePlaying(bool playing);
Message MakeSerials(const std::vector<std::string>& serials);
Message MakeException(std::string message, std::string trace);

// Splits the frame into metadata `[fmt, [w, h], index, queued, t]` and the
// raw pixel payload.
Message MakeImageMessage(core::schema::FrameEnvelope frame);

bool ParseOpenCam(const Message& message, std::string& serial, std::string& error);
bool ParseSettingRequest(const Message& message, std::string& name, core::json::Value& value,
                         std::string& error);
bool ParsePlaying(const Message& message, bool& playing, std::string& error);
bool ParseSerials(const Message& message, std::vector<std::string>& serials, std::string& error);
bool ParseException(const Message& message, std::string& text, std::string& trace,
                    std::string& error);
bool ParseImageMessage(const Message& message, core::schema::FrameEnvelope& frame,
                       std::string& error);

} // namespace camhost::protocol
