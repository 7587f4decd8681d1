#pragma once

#include "protocol/message.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camhost::protocol {

// Wire frame: big-endian u32 text length, big-endian u32 binary length, then
// the UTF-8 text section, then the binary section.
inline constexpr std::size_t kHeaderSize = 8;
inline constexpr std::uint32_t kMaxTextBytes = 256U * 1024U * 1024U;
inline constexpr std::uint32_t kMaxBinaryBytes = 1024U * 1024U * 1024U;

struct FrameHeader {
  std::uint32_t text_len = 0;
  std::uint32_t binary_len = 0;
};

std::array<std::uint8_t, kHeaderSize> EncodeHeader(const FrameHeader& header);

// Rejects headers whose lengths exceed the frame limits so a corrupt or
// hostile peer cannot trigger an unbounded allocation.
bool DecodeHeader(const std::uint8_t* data, FrameHeader& header, std::string& error);

// Text section: JSON of `[tag, value]`.
bool EncodeText(const Message& message, std::string& text, std::string& error);

// Builds a message from a received text section and binary section. Only
// `image` may carry a binary section.
bool Decode(std::string_view text, std::vector<std::uint8_t> binary, Message& message,
            std::string& error);

// Complete frame (header + text + binary) as one contiguous buffer.
bool EncodeFrame(const Message& message, std::vector<std::uint8_t>& frame, std::string& error);

} // namespace camhost::protocol
