#pragma once

#include "driver/camera_driver.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace camhost::driver {

// Resolves the worker's driver argument:
//   "sim"            simulated camera with default config
//   "sim:k=v,..."    simulated camera with options (see sim_driver_config.hpp)
//   <directory>      vendor driver binaries; yields the vendor SDK boundary
// Anything else fails, which the worker reports as driver-unavailable.
bool CreateCameraDriver(std::string_view spec, std::unique_ptr<ICameraDriver>& driver,
                        std::string& error);

} // namespace camhost::driver
