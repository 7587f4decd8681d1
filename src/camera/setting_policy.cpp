#include "camera/setting_policy.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace camhost::camera {

namespace json = core::json;
namespace schema = core::schema;

namespace {

constexpr std::int64_t kMaxCount = 0x7FFFFFFF;

bool ReadNumber(std::string_view name, const json::Value& value, double& out, std::string& error) {
  if (!value.IsNumeric() || !std::isfinite(value.AsDouble())) {
    error = "invalid value for '" + std::string(name) + "': expected a number, got " +
            json::ToString(value.type);
    return false;
  }
  out = value.AsDouble();
  return true;
}

bool ReadChoice(std::string_view name, const json::Value& value,
                const std::vector<std::string>& supported, std::string& out, std::string& error) {
  if (value.type != json::Value::Type::kString) {
    error = "invalid value for '" + std::string(name) + "': expected a string, got " +
            json::ToString(value.type);
    return false;
  }
  if (std::find(supported.begin(), supported.end(), value.string_value) == supported.end()) {
    std::string choices;
    for (const std::string& choice : supported) {
      choices += choices.empty() ? "" : ", ";
      choices += "'" + choice + "'";
    }
    error = "invalid value for '" + std::string(name) + "': '" + value.string_value +
            "' is not one of [" + choices + "]";
    return false;
  }
  out = value.string_value;
  return true;
}

// Clamp first, then truncate toward zero.
std::int64_t ClampToInt(double value, std::int64_t min, std::int64_t max) {
  const double clamped =
      std::max(static_cast<double>(min), std::min(value, static_cast<double>(max)));
  return static_cast<std::int64_t>(std::trunc(clamped));
}

bool ReadColorGain(const json::Value& value, schema::ColorGain& gain, std::string& error) {
  if (value.type != json::Value::Type::kArray || value.array_value.size() != gain.size()) {
    error = "invalid value for 'color_gain': expected a 3-element sequence (r, g, b)";
    return false;
  }
  schema::ColorGain parsed{};
  for (std::size_t i = 0; i < parsed.size(); ++i) {
    if (!ReadNumber("color_gain", value.array_value[i], parsed[i], error)) {
      return false;
    }
  }
  gain = parsed;
  return true;
}

} // namespace

SettingCheck ValidateSettingWrite(bool playing, std::string_view name) {
  SettingCheck check;
  if (playing) {
    if (!schema::IsPlaySetting(name)) {
      check.ok = false;
      check.reason = "Setting \"" + std::string(name) + "\" cannot be set while the camera is playing";
    }
  } else if (!schema::IsKnownSetting(name)) {
    check.ok = false;
    check.reason = "Setting \"" + std::string(name) + "\" is not recognized";
  }
  return check;
}

bool PlanSettingWrite(const schema::SettingsSnapshot& snapshot, std::string_view name,
                      const json::Value& value, schema::SettingsPatch& plan, std::string& error) {
  const schema::Settings& current = snapshot.values;
  const std::int64_t sensor_w = snapshot.sensor_size[0];
  const std::int64_t sensor_h = snapshot.sensor_size[1];
  schema::SettingsPatch planned;

  if (name == "trigger_type") {
    std::string trigger;
    if (!ReadChoice(name, value, snapshot.supported_triggers, trigger, error)) {
      return false;
    }
    planned.trigger_type = std::move(trigger);
  } else if (name == "freq") {
    std::string freq;
    if (!ReadChoice(name, value, snapshot.supported_freqs, freq, error)) {
      return false;
    }
    planned.freq = std::move(freq);
  } else if (name == "taps") {
    std::string taps;
    if (!ReadChoice(name, value, snapshot.supported_taps, taps, error)) {
      return false;
    }
    planned.taps = std::move(taps);
  } else if (name == "color_gain") {
    if (!snapshot.supports_color) {
      error = "invalid value for 'color_gain': camera does not support color";
      return false;
    }
    schema::ColorGain gain{};
    if (!ReadColorGain(value, gain, error)) {
      return false;
    }
    planned.color_gain = gain;
  } else {
    double number = 0.0;
    if (!ReadNumber(name, value, number, error)) {
      return false;
    }

    if (name == "exposure_ms") {
      // The camera takes whole microseconds.
      const double clamped =
          std::max(snapshot.exposure_range.min, std::min(number, snapshot.exposure_range.max));
      const auto exposure_us = static_cast<std::int64_t>(std::trunc(clamped * 1000.0));
      planned.exposure_ms = static_cast<double>(exposure_us) / 1000.0;
    } else if (name == "binning_x") {
      planned.binning_x =
          ClampToInt(number, snapshot.binning_x_range.min, snapshot.binning_x_range.max);
    } else if (name == "binning_y") {
      planned.binning_y =
          ClampToInt(number, snapshot.binning_y_range.min, snapshot.binning_y_range.max);
    } else if (name == "roi_x") {
      const std::int64_t x = ClampToInt(number, 0, std::max<std::int64_t>(0, sensor_w - 1));
      planned.roi_x = x;
      planned.roi_width = std::min(sensor_w - x, current.roi_width);
    } else if (name == "roi_y") {
      const std::int64_t y = ClampToInt(number, 0, std::max<std::int64_t>(0, sensor_h - 1));
      planned.roi_y = y;
      planned.roi_height = std::min(sensor_h - y, current.roi_height);
    } else if (name == "roi_width") {
      planned.roi_width = ClampToInt(number, 1, std::max<std::int64_t>(1, sensor_w - current.roi_x));
      planned.roi_x = current.roi_x;
    } else if (name == "roi_height") {
      planned.roi_height =
          ClampToInt(number, 1, std::max<std::int64_t>(1, sensor_h - current.roi_y));
      planned.roi_y = current.roi_y;
    } else if (name == "trigger_count") {
      planned.trigger_count = ClampToInt(number, 0, kMaxCount);
    } else if (name == "frame_queue_size") {
      planned.frame_queue_size = ClampToInt(number, 1, kMaxCount);
    } else if (name == "gain") {
      planned.gain = ClampToInt(number, snapshot.gain_range.min, snapshot.gain_range.max);
    } else if (name == "black_level") {
      planned.black_level =
          ClampToInt(number, snapshot.black_level_range.min, snapshot.black_level_range.max);
    } else {
      error = "Setting \"" + std::string(name) + "\" is not recognized";
      return false;
    }
  }

  plan = std::move(planned);
  return true;
}

} // namespace camhost::camera
