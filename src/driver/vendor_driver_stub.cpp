#include "driver/vendor_driver_stub.hpp"

#include <utility>

namespace camhost::driver {

VendorDriverStub::VendorDriverStub(std::filesystem::path driver_bin_path)
    : driver_bin_path_(std::move(driver_bin_path)) {}

bool VendorDriverStub::Unavailable(const char* operation, std::string& error) const {
  error = std::string("cannot ") + operation + ": vendor sdk adapter is not compiled in (driver "
          "binaries at '" + driver_bin_path_.string() + "')";
  return false;
}

bool VendorDriverStub::DiscoverSerials(std::vector<std::string>& serials, std::string& error) {
  serials.clear();
  return Unavailable("discover cameras", error);
}

bool VendorDriverStub::Open(const std::string& serial, std::string& error) {
  return Unavailable(("open camera '" + serial + "'").c_str(), error);
}

bool VendorDriverStub::Close(std::string& error) {
  // Nothing was ever opened.
  (void)error;
  return true;
}

bool VendorDriverStub::Arm(std::string& error) {
  return Unavailable("arm", error);
}

bool VendorDriverStub::IssueSoftwareTrigger(std::string& error) {
  return Unavailable("trigger", error);
}

bool VendorDriverStub::Disarm(std::string& error) {
  return Unavailable("disarm", error);
}

bool VendorDriverStub::IsArmed() const {
  return false;
}

bool VendorDriverStub::ReadSettings(core::schema::SettingsSnapshot& snapshot, std::string& error) {
  (void)snapshot;
  return Unavailable("read settings", error);
}

bool VendorDriverStub::WriteSettings(const core::schema::SettingsPatch& patch, std::string& error) {
  (void)patch;
  return Unavailable("write settings", error);
}

bool VendorDriverStub::PollFrame(std::optional<core::schema::FrameEnvelope>& frame,
                                 std::string& error) {
  frame.reset();
  return Unavailable("poll frame", error);
}

} // namespace camhost::driver
