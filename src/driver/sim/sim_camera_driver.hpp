#pragma once

#include "driver/camera_driver.hpp"
#include "driver/sim/sim_driver_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camhost::driver::sim {

// Deterministic, hardware-free camera.
//
// Frames are paced from the monotonic clock at the slower of the configured
// frame rate and the exposure time. Software trigger mode yields
// `trigger_count` frames per trigger (0 means unlimited); hardware trigger
// mode streams as if an external trigger fired every frame period. Frames
// due while the caller is not polling accumulate up to `frame_queue_size`;
// older ones are dropped and their index is skipped.
class SimCameraDriver final : public ICameraDriver {
public:
  explicit SimCameraDriver(SimDriverConfig config);

  bool DiscoverSerials(std::vector<std::string>& serials, std::string& error) override;
  bool Open(const std::string& serial, std::string& error) override;
  bool Close(std::string& error) override;
  bool Arm(std::string& error) override;
  bool IssueSoftwareTrigger(std::string& error) override;
  bool Disarm(std::string& error) override;
  bool IsArmed() const override;
  bool ReadSettings(core::schema::SettingsSnapshot& snapshot, std::string& error) override;
  bool WriteSettings(const core::schema::SettingsPatch& patch, std::string& error) override;
  bool PollFrame(std::optional<core::schema::FrameEnvelope>& frame, std::string& error) override;

private:
  bool RequireOpen(const char* operation, std::string& error) const;
  double FramePeriodSeconds() const;
  core::schema::FrameEnvelope RenderFrame(std::uint64_t frame_index,
                                          std::uint32_t queued_count) const;

  const SimDriverConfig config_;
  std::optional<std::string> open_serial_;
  core::schema::SettingsSnapshot snapshot_;
  bool armed_ = false;
  bool unlimited_frames_ = false;
  std::uint64_t frames_remaining_ = 0;
  std::uint64_t frames_delivered_ = 0;
  std::uint64_t next_frame_index_ = 1;
  double next_due_s_ = 0.0;
};

} // namespace camhost::driver::sim
