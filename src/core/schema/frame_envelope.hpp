#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camhost::core::schema {

enum class PixelFormat {
  kMono16 = 0,
  kBgr48,
};

inline const char* ToString(PixelFormat format) {
  switch (format) {
  case PixelFormat::kMono16:
    return "mono16";
  case PixelFormat::kBgr48:
    return "bgr48";
  }
  return "mono16";
}

// Accepts the canonical names plus the little-endian pix_fmt spellings that
// image libraries use for the same layouts.
inline bool ParsePixelFormat(std::string_view raw, PixelFormat& format) {
  if (raw == "mono16" || raw == "gray16le") {
    format = PixelFormat::kMono16;
    return true;
  }
  if (raw == "bgr48" || raw == "bgr48le") {
    format = PixelFormat::kBgr48;
    return true;
  }
  return false;
}

inline std::uint32_t BytesPerPixel(PixelFormat format) {
  return format == PixelFormat::kBgr48 ? 6U : 2U;
}

// One captured image plus the metadata the driver reported with it.
// Produced by the control loop and handed to the transport by value; nothing
// mutates it after the driver poll that created it.
struct FrameEnvelope {
  std::vector<std::uint8_t> pixel_bytes;
  PixelFormat pixel_format = PixelFormat::kMono16;
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::uint64_t frame_index = 0;
  std::uint32_t queued_count = 0;
  double capture_time = 0.0;
};

} // namespace camhost::core::schema
