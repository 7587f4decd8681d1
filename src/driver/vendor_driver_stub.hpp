#pragma once

#include "driver/camera_driver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace camhost::driver {

// Integration boundary for the vendor camera SDK.
//
// The worker is pointed at a directory of vendor driver binaries. No SDK
// adapter is compiled into this build, so once the directory is accepted
// every camera operation reports SDK_UNAVAILABLE. A real adapter replaces
// this class behind `ICameraDriver` without touching the controller.
class VendorDriverStub final : public ICameraDriver {
public:
  explicit VendorDriverStub(std::filesystem::path driver_bin_path);

  const std::filesystem::path& driver_bin_path() const { return driver_bin_path_; }

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
  bool Unavailable(const char* operation, std::string& error) const;

  std::filesystem::path driver_bin_path_;
};

} // namespace camhost::driver
