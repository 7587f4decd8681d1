#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camhost::driver::sim {

// Fault injection knobs. All disabled by default.
struct SimFaultConfig {
  bool fail_open = false;
  std::uint64_t fail_after_frames = 0; // 0 disables; PollFrame reports a disconnect afterwards
  std::string fail_setting;            // setting name whose write is rejected
};

// Shape of the simulated camera. Built once from the driver spec and never
// mutated afterwards.
struct SimDriverConfig {
  std::vector<std::string> serials = {"sim-00001"};
  std::uint32_t sensor_width = 64;
  std::uint32_t sensor_height = 48;
  double fps = 100.0;
  bool color = false;
  SimFaultConfig faults;
};

// Parses the option list of a `sim:<k=v,...>` driver spec. Keys:
// `serials` (pipe separated), `width`, `height`, `fps`, `color`,
// `fail_open`, `fail_after_frames`, `fail_setting`.
bool ParseSimDriverConfig(std::string_view options, SimDriverConfig& config, std::string& error);

} // namespace camhost::driver::sim
