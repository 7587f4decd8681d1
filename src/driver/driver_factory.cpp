#include "driver/driver_factory.hpp"

#include "driver/sim/sim_camera_driver.hpp"
#include "driver/sim/sim_driver_config.hpp"
#include "driver/vendor_driver_stub.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace camhost::driver {

namespace {

constexpr std::string_view kSimSpec = "sim";
constexpr std::string_view kSimOptionsPrefix = "sim:";

} // namespace

bool CreateCameraDriver(std::string_view spec, std::unique_ptr<ICameraDriver>& driver,
                        std::string& error) {
  if (spec == kSimSpec || spec.substr(0, kSimOptionsPrefix.size()) == kSimOptionsPrefix) {
    const std::string_view options =
        spec == kSimSpec ? std::string_view{} : spec.substr(kSimOptionsPrefix.size());
    sim::SimDriverConfig config;
    if (!sim::ParseSimDriverConfig(options, config, error)) {
      return false;
    }
    driver = std::make_unique<sim::SimCameraDriver>(std::move(config));
    return true;
  }

  if (spec.empty()) {
    error = "driver binary path cannot be empty";
    return false;
  }

  const std::filesystem::path path{std::string(spec)};
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    error = "driver binary path '" + path.string() + "' is not a directory" +
            (ec ? " (" + ec.message() + ")" : std::string());
    return false;
  }
  driver = std::make_unique<VendorDriverStub>(path);
  return true;
}

} // namespace camhost::driver
