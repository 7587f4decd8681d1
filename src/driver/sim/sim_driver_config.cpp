#include "driver/sim/sim_driver_config.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace camhost::driver::sim {

namespace {

constexpr std::uint32_t kMaxSensorEdge = 8192;

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    const std::size_t end = text.find(separator, begin);
    if (end == std::string_view::npos) {
      parts.push_back(text.substr(begin));
      break;
    }
    parts.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
  return parts;
}

template <typename T>
bool ParseUnsigned(std::string_view text, T& value) {
  if (text.empty()) {
    return false;
  }
  T parsed = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseFlag(std::string_view text, bool& value) {
  if (text == "1" || text == "true" || text == "yes") {
    value = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "no") {
    value = false;
    return true;
  }
  return false;
}

bool ParsePositiveDouble(std::string_view text, double& value) {
  const std::string owned(text);
  char* end = nullptr;
  const double parsed = std::strtod(owned.c_str(), &end);
  if (owned.empty() || end != owned.c_str() + owned.size() || !std::isfinite(parsed) ||
      parsed <= 0.0) {
    return false;
  }
  value = parsed;
  return true;
}

bool ApplyOption(std::string_view key, std::string_view value, SimDriverConfig& config,
                 std::string& error) {
  const auto invalid = [&](std::string_view expected) {
    error = "invalid sim driver option " + std::string(key) + "=" + std::string(value) +
            " (expected " + std::string(expected) + ")";
    return false;
  };

  if (key == "serials") {
    config.serials.clear();
    for (const std::string_view serial : Split(value, '|')) {
      if (!serial.empty()) {
        config.serials.emplace_back(serial);
      }
    }
    return true;
  }
  if (key == "width" || key == "height") {
    std::uint32_t edge = 0;
    if (!ParseUnsigned(value, edge) || edge == 0U || edge > kMaxSensorEdge) {
      return invalid("an integer in [1, 8192]");
    }
    (key == "width" ? config.sensor_width : config.sensor_height) = edge;
    return true;
  }
  if (key == "fps") {
    return ParsePositiveDouble(value, config.fps) || invalid("a positive number");
  }
  if (key == "color") {
    return ParseFlag(value, config.color) || invalid("true or false");
  }
  if (key == "fail_open") {
    return ParseFlag(value, config.faults.fail_open) || invalid("true or false");
  }
  if (key == "fail_after_frames") {
    return ParseUnsigned(value, config.faults.fail_after_frames) ||
           invalid("a non-negative integer");
  }
  if (key == "fail_setting") {
    config.faults.fail_setting = std::string(value);
    return true;
  }

  error = "unknown sim driver option '" + std::string(key) + "'";
  return false;
}

} // namespace

bool ParseSimDriverConfig(std::string_view options, SimDriverConfig& config, std::string& error) {
  SimDriverConfig parsed;
  if (!options.empty()) {
    for (const std::string_view option : Split(options, ',')) {
      if (option.empty()) {
        continue;
      }
      const std::size_t eq = option.find('=');
      if (eq == std::string_view::npos || eq == 0U) {
        error = "sim driver option '" + std::string(option) + "' must be key=value";
        return false;
      }
      if (!ApplyOption(option.substr(0, eq), option.substr(eq + 1), parsed, error)) {
        return false;
      }
    }
  }
  std::sort(parsed.serials.begin(), parsed.serials.end());
  config = std::move(parsed);
  return true;
}

} // namespace camhost::driver::sim
