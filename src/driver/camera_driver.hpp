#pragma once

#include "core/schema/frame_envelope.hpp"
#include "core/schema/settings_snapshot.hpp"

#include <optional>
#include <string>
#include <vector>

namespace camhost::driver {

// Contract between the camera controller and a vendor camera SDK.
//
// Only the control-loop thread drives an opened instance. Discovery is the
// one call made outside a session, on an instance that never opens a camera.
// Every operation reports failure as `false` plus a human-readable error.
class ICameraDriver {
public:
  virtual ~ICameraDriver() = default;

  // Serials of the attached cameras, sorted ascending.
  virtual bool DiscoverSerials(std::vector<std::string>& serials, std::string& error) = 0;

  virtual bool Open(const std::string& serial, std::string& error) = 0;

  // Releases the driver session. Closing a closed driver succeeds.
  virtual bool Close(std::string& error) = 0;

  virtual bool Arm(std::string& error) = 0;
  virtual bool IssueSoftwareTrigger(std::string& error) = 0;
  virtual bool Disarm(std::string& error) = 0;
  virtual bool IsArmed() const = 0;

  // Full current settings together with ranges and capabilities.
  virtual bool ReadSettings(core::schema::SettingsSnapshot& snapshot, std::string& error) = 0;

  // Applies fields that were already validated and clamped against the last
  // snapshot. Absent fields are left untouched.
  virtual bool WriteSettings(const core::schema::SettingsPatch& patch, std::string& error) = 0;

  // Non-blocking. Leaves `frame` empty when nothing is queued.
  virtual bool PollFrame(std::optional<core::schema::FrameEnvelope>& frame,
                         std::string& error) = 0;
};

} // namespace camhost::driver
