#include "driver/sim/sim_camera_driver.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace camhost::driver::sim {

namespace schema = core::schema;

namespace {

constexpr std::int64_t kMaxBinning = 4;
constexpr std::int64_t kMaxGain = 100;
constexpr std::int64_t kMaxBlackLevel = 100;
constexpr double kMaxExposureMs = 100.0;
constexpr std::uint32_t kMaxPixelValue = 0xFFFFU;

schema::SettingsSnapshot DefaultSnapshot(const SimDriverConfig& config) {
  schema::SettingsSnapshot snapshot;
  snapshot.values.exposure_ms = 5.0;
  snapshot.values.binning_x = 1;
  snapshot.values.binning_y = 1;
  snapshot.values.roi_x = 0;
  snapshot.values.roi_y = 0;
  snapshot.values.roi_width = config.sensor_width;
  snapshot.values.roi_height = config.sensor_height;
  snapshot.values.trigger_type = std::string(schema::kSoftwareTrigger);
  snapshot.values.trigger_count = 0;
  snapshot.values.frame_queue_size = 4;

  snapshot.exposure_range = {0.0, kMaxExposureMs};
  snapshot.binning_x_range = {1, kMaxBinning};
  snapshot.binning_y_range = {1, kMaxBinning};
  snapshot.gain_range = {0, kMaxGain};
  snapshot.black_level_range = {0, kMaxBlackLevel};
  snapshot.sensor_size = {config.sensor_width, config.sensor_height};
  snapshot.supported_freqs = {"20 MHz", "40 MHz"};
  snapshot.supported_taps = {"1", "2"};
  snapshot.supports_color = config.color;
  return snapshot;
}

void AppendLe16(std::vector<std::uint8_t>& out, std::uint32_t value) {
  const std::uint32_t clamped = std::min(value, kMaxPixelValue);
  out.push_back(static_cast<std::uint8_t>(clamped & 0xFFU));
  out.push_back(static_cast<std::uint8_t>((clamped >> 8) & 0xFFU));
}

} // namespace

SimCameraDriver::SimCameraDriver(SimDriverConfig config) : config_(std::move(config)) {}

bool SimCameraDriver::DiscoverSerials(std::vector<std::string>& serials, std::string& error) {
  (void)error;
  serials = config_.serials;
  std::sort(serials.begin(), serials.end());
  return true;
}

bool SimCameraDriver::Open(const std::string& serial, std::string& error) {
  if (open_serial_.has_value()) {
    error = "sim camera '" + *open_serial_ + "' is already open";
    return false;
  }
  if (std::find(config_.serials.begin(), config_.serials.end(), serial) ==
      config_.serials.end()) {
    error = "camera with serial '" + serial + "' not found";
    return false;
  }
  if (config_.faults.fail_open) {
    error = "sim camera '" + serial + "' is busy (injected open failure)";
    return false;
  }

  open_serial_ = serial;
  snapshot_ = DefaultSnapshot(config_);
  armed_ = false;
  unlimited_frames_ = false;
  frames_remaining_ = 0;
  frames_delivered_ = 0;
  next_frame_index_ = 1;
  return true;
}

bool SimCameraDriver::Close(std::string& error) {
  (void)error;
  armed_ = false;
  open_serial_.reset();
  return true;
}

bool SimCameraDriver::Arm(std::string& error) {
  if (!RequireOpen("arm", error)) {
    return false;
  }
  if (armed_) {
    error = "sim camera is already armed";
    return false;
  }
  armed_ = true;
  frames_remaining_ = 0;
  unlimited_frames_ = snapshot_.values.trigger_type == schema::kHardwareTrigger;
  next_due_s_ = core::MonotonicSeconds() + FramePeriodSeconds();
  return true;
}

bool SimCameraDriver::IssueSoftwareTrigger(std::string& error) {
  if (!RequireOpen("trigger", error)) {
    return false;
  }
  if (!armed_) {
    error = "sim camera is not armed; cannot issue a software trigger";
    return false;
  }
  if (snapshot_.values.trigger_type != schema::kSoftwareTrigger) {
    error = "software trigger issued in hardware trigger state";
    return false;
  }

  const bool was_idle = !unlimited_frames_ && frames_remaining_ == 0U;
  if (snapshot_.values.trigger_count == 0) {
    unlimited_frames_ = true;
  } else {
    frames_remaining_ += static_cast<std::uint64_t>(snapshot_.values.trigger_count);
  }
  if (was_idle) {
    next_due_s_ = core::MonotonicSeconds() + FramePeriodSeconds();
  }
  return true;
}

bool SimCameraDriver::Disarm(std::string& error) {
  if (!RequireOpen("disarm", error)) {
    return false;
  }
  if (!armed_) {
    error = "sim camera is not armed";
    return false;
  }
  armed_ = false;
  unlimited_frames_ = false;
  frames_remaining_ = 0;
  return true;
}

bool SimCameraDriver::IsArmed() const {
  return armed_;
}

bool SimCameraDriver::ReadSettings(schema::SettingsSnapshot& snapshot, std::string& error) {
  if (!RequireOpen("read settings", error)) {
    return false;
  }
  snapshot = snapshot_;
  return true;
}

bool SimCameraDriver::WriteSettings(const schema::SettingsPatch& patch, std::string& error) {
  if (!RequireOpen("write settings", error)) {
    return false;
  }

  const core::json::Value written = schema::ToJson(patch);
  for (const std::string_view name : schema::kAllSettings) {
    if (core::json::FindMember(written, name) == nullptr) {
      continue;
    }
    if (name == config_.faults.fail_setting) {
      error = "sim camera rejected write of '" + std::string(name) +
              "' (injected invalid configuration)";
      return false;
    }
    if (armed_ && !schema::IsPlaySetting(name)) {
      error = "cannot write '" + std::string(name) + "' while armed";
      return false;
    }
  }

  schema::MergeSettings(snapshot_.values, patch);
  return true;
}

bool SimCameraDriver::PollFrame(std::optional<schema::FrameEnvelope>& frame, std::string& error) {
  frame.reset();
  if (!RequireOpen("poll frame", error)) {
    return false;
  }
  if (!armed_) {
    error = "sim camera is not armed; no frames to poll";
    return false;
  }
  if (config_.faults.fail_after_frames > 0U &&
      frames_delivered_ >= config_.faults.fail_after_frames) {
    error = "sim camera disconnected after " + std::to_string(frames_delivered_) +
            " frames (injected fault)";
    return false;
  }
  if (!unlimited_frames_ && frames_remaining_ == 0U) {
    return true;
  }

  const double now = core::MonotonicSeconds();
  if (now < next_due_s_) {
    return true;
  }

  const double period = FramePeriodSeconds();
  auto backlog = static_cast<std::uint64_t>(std::floor((now - next_due_s_) / period));
  const auto queue_size =
      static_cast<std::uint64_t>(std::max<std::int64_t>(1, snapshot_.values.frame_queue_size));
  if (backlog >= queue_size) {
    // The camera queue overflowed; those frames are lost.
    const std::uint64_t dropped = backlog - (queue_size - 1U);
    next_due_s_ += static_cast<double>(dropped) * period;
    next_frame_index_ += dropped;
    backlog = queue_size - 1U;
  }
  if (!unlimited_frames_) {
    backlog = std::min(backlog, frames_remaining_ - 1U);
    --frames_remaining_;
  }

  frame = RenderFrame(next_frame_index_, static_cast<std::uint32_t>(backlog));
  ++next_frame_index_;
  ++frames_delivered_;
  next_due_s_ += period;
  return true;
}

bool SimCameraDriver::RequireOpen(const char* operation, std::string& error) const {
  if (open_serial_.has_value()) {
    return true;
  }
  error = std::string("sim camera is not open; cannot ") + operation;
  return false;
}

double SimCameraDriver::FramePeriodSeconds() const {
  return std::max(1.0 / config_.fps, snapshot_.values.exposure_ms / 1000.0);
}

schema::FrameEnvelope SimCameraDriver::RenderFrame(std::uint64_t frame_index,
                                                   std::uint32_t queued_count) const {
  const schema::Settings& values = snapshot_.values;
  const std::int64_t bin_x = std::max<std::int64_t>(1, values.binning_x);
  const std::int64_t bin_y = std::max<std::int64_t>(1, values.binning_y);

  schema::FrameEnvelope envelope;
  envelope.pixel_format = config_.color ? schema::PixelFormat::kBgr48 : schema::PixelFormat::kMono16;
  envelope.width = static_cast<std::uint32_t>(std::max<std::int64_t>(1, values.roi_width / bin_x));
  envelope.height =
      static_cast<std::uint32_t>(std::max<std::int64_t>(1, values.roi_height / bin_y));
  envelope.frame_index = frame_index;
  envelope.queued_count = queued_count;
  envelope.capture_time = core::MonotonicSeconds();

  const std::uint32_t channels = config_.color ? 3U : 1U;
  envelope.pixel_bytes.reserve(static_cast<std::size_t>(envelope.width) * envelope.height *
                               schema::BytesPerPixel(envelope.pixel_format));
  const auto gain = static_cast<std::uint32_t>(values.gain + 1);
  const auto black_level = static_cast<std::uint32_t>(values.black_level);
  for (std::uint32_t y = 0; y < envelope.height; ++y) {
    for (std::uint32_t x = 0; x < envelope.width; ++x) {
      const auto ramp = static_cast<std::uint32_t>((x + y + frame_index) % 256U);
      const std::uint32_t level = black_level + ramp * gain;
      for (std::uint32_t c = 0; c < channels; ++c) {
        // BGR channel order; color_gain is stored as (r, g, b).
        const double channel_gain = channels == 3U ? values.color_gain[2U - c] : 1.0;
        const double scaled = std::clamp(level * channel_gain, 0.0, double{kMaxPixelValue});
        AppendLe16(envelope.pixel_bytes, static_cast<std::uint32_t>(scaled));
      }
    }
  }
  return envelope;
}

} // namespace camhost::driver::sim
