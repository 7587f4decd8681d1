#include "core/schema/settings_snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace camhost::core::schema {

namespace {

json::Value ToJsonValue(double value) {
  return json::MakeNumber(value);
}

json::Value ToJsonValue(std::int64_t value) {
  return json::MakeInteger(value);
}

json::Value ToJsonValue(const std::string& value) {
  return json::MakeString(value);
}

json::Value ToJsonValue(const ColorGain& value) {
  json::Value::Array items;
  for (const double channel : value) {
    items.push_back(json::MakeNumber(channel));
  }
  return json::MakeArray(std::move(items));
}

json::Value ToJsonValue(const std::vector<std::string>& values) {
  json::Value::Array items;
  for (const std::string& value : values) {
    items.push_back(json::MakeString(value));
  }
  return json::MakeArray(std::move(items));
}

template <typename T>
json::Value RangeToJson(const Range<T>& range) {
  return json::MakeArray({ToJsonValue(range.min), ToJsonValue(range.max)});
}

bool ReadField(const json::Value& value, double& out) {
  if (!value.IsNumeric()) {
    return false;
  }
  out = value.AsDouble();
  return std::isfinite(out);
}

// Integer settings accept floats too and truncate them, so a client that
// sends `512.0` for a pixel count still gets a valid write.
bool ReadField(const json::Value& value, std::int64_t& out) {
  if (value.type == json::Value::Type::kInteger) {
    out = value.integer_value;
    return true;
  }
  if (value.type != json::Value::Type::kNumber || !std::isfinite(value.number_value)) {
    return false;
  }
  constexpr double kLimit = 9.2e18;
  if (std::fabs(value.number_value) > kLimit) {
    return false;
  }
  out = static_cast<std::int64_t>(value.number_value);
  return true;
}

bool ReadField(const json::Value& value, std::string& out) {
  if (value.type != json::Value::Type::kString) {
    return false;
  }
  out = value.string_value;
  return true;
}

bool ReadField(const json::Value& value, ColorGain& out) {
  if (value.type != json::Value::Type::kArray || value.array_value.size() != out.size()) {
    return false;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (!ReadField(value.array_value[i], out[i])) {
      return false;
    }
  }
  return true;
}

bool ReadField(const json::Value& value, bool& out) {
  if (value.type != json::Value::Type::kBool) {
    return false;
  }
  out = value.bool_value;
  return true;
}

bool ReadField(const json::Value& value, std::vector<std::string>& out) {
  if (value.type != json::Value::Type::kArray) {
    return false;
  }
  std::vector<std::string> parsed;
  for (const json::Value& item : value.array_value) {
    std::string text;
    if (!ReadField(item, text)) {
      return false;
    }
    parsed.push_back(std::move(text));
  }
  out = std::move(parsed);
  return true;
}

template <typename T>
bool ReadField(const json::Value& value, Range<T>& out) {
  if (value.type != json::Value::Type::kArray || value.array_value.size() != 2U) {
    return false;
  }
  Range<T> parsed;
  if (!ReadField(value.array_value[0], parsed.min) || !ReadField(value.array_value[1], parsed.max)) {
    return false;
  }
  out = parsed;
  return true;
}

bool ReadField(const json::Value& value, std::array<std::int64_t, 2>& out) {
  if (value.type != json::Value::Type::kArray || value.array_value.size() != 2U) {
    return false;
  }
  std::array<std::int64_t, 2> parsed{};
  if (!ReadField(value.array_value[0], parsed[0]) || !ReadField(value.array_value[1], parsed[1])) {
    return false;
  }
  out = parsed;
  return true;
}

template <typename T>
const char* ExpectedTypeLabel() {
  if constexpr (std::is_same_v<T, double>) {
    return "a number";
  } else if constexpr (std::is_same_v<T, std::int64_t>) {
    return "an integer";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "a string";
  } else if constexpr (std::is_same_v<T, ColorGain>) {
    return "a sequence of 3 numbers";
  } else if constexpr (std::is_same_v<T, bool>) {
    return "a bool";
  } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
    return "a sequence of strings";
  } else {
    return "a 2-element sequence";
  }
}

template <typename T>
bool ReadMember(const json::Value& object, std::string_view name, std::optional<T>& field,
                std::string& error) {
  const json::Value* member = json::FindMember(object, name);
  if (member == nullptr) {
    return true;
  }
  T parsed{};
  if (!ReadField(*member, parsed)) {
    error = "invalid value for '" + std::string(name) + "': expected " + ExpectedTypeLabel<T>();
    return false;
  }
  field = std::move(parsed);
  return true;
}

template <typename T>
void AppendIfPresent(json::Value::Object& out, std::string_view name,
                     const std::optional<T>& field) {
  if (field.has_value()) {
    out[std::string(name)] = ToJsonValue(field.value());
  }
}

template <typename T>
void MergeField(std::string_view name, const std::optional<T>& patch, T& target,
                std::vector<std::string>& changed) {
  if (!patch.has_value()) {
    return;
  }
  if (!(target == patch.value())) {
    changed.emplace_back(name);
  }
  target = patch.value();
}

SettingsPatch FullPatch(const Settings& settings) {
  SettingsPatch patch;
  patch.exposure_ms = settings.exposure_ms;
  patch.binning_x = settings.binning_x;
  patch.binning_y = settings.binning_y;
  patch.roi_x = settings.roi_x;
  patch.roi_y = settings.roi_y;
  patch.roi_width = settings.roi_width;
  patch.roi_height = settings.roi_height;
  patch.trigger_type = settings.trigger_type;
  patch.trigger_count = settings.trigger_count;
  patch.frame_queue_size = settings.frame_queue_size;
  patch.gain = settings.gain;
  patch.black_level = settings.black_level;
  patch.freq = settings.freq;
  patch.taps = settings.taps;
  patch.color_gain = settings.color_gain;
  return patch;
}

} // namespace

bool IsKnownSetting(std::string_view name) {
  return std::find(kAllSettings.begin(), kAllSettings.end(), name) != kAllSettings.end();
}

bool IsPlaySetting(std::string_view name) {
  return std::find(kPlaySettings.begin(), kPlaySettings.end(), name) != kPlaySettings.end();
}

bool SettingsPatch::empty() const {
  return !exposure_ms && !binning_x && !binning_y && !roi_x && !roi_y && !roi_width &&
         !roi_height && !trigger_type && !trigger_count && !frame_queue_size && !gain &&
         !black_level && !freq && !taps && !color_gain;
}

std::vector<std::string> MergeSettings(Settings& settings, const SettingsPatch& patch) {
  std::vector<std::string> changed;
  MergeField("exposure_ms", patch.exposure_ms, settings.exposure_ms, changed);
  MergeField("binning_x", patch.binning_x, settings.binning_x, changed);
  MergeField("binning_y", patch.binning_y, settings.binning_y, changed);
  MergeField("roi_x", patch.roi_x, settings.roi_x, changed);
  MergeField("roi_y", patch.roi_y, settings.roi_y, changed);
  MergeField("roi_width", patch.roi_width, settings.roi_width, changed);
  MergeField("roi_height", patch.roi_height, settings.roi_height, changed);
  MergeField("trigger_type", patch.trigger_type, settings.trigger_type, changed);
  MergeField("trigger_count", patch.trigger_count, settings.trigger_count, changed);
  MergeField("frame_queue_size", patch.frame_queue_size, settings.frame_queue_size, changed);
  MergeField("gain", patch.gain, settings.gain, changed);
  MergeField("black_level", patch.black_level, settings.black_level, changed);
  MergeField("freq", patch.freq, settings.freq, changed);
  MergeField("taps", patch.taps, settings.taps, changed);
  MergeField("color_gain", patch.color_gain, settings.color_gain, changed);
  return changed;
}

json::Value ToJson(const SettingsPatch& patch) {
  json::Value::Object out;
  AppendIfPresent(out, "exposure_ms", patch.exposure_ms);
  AppendIfPresent(out, "binning_x", patch.binning_x);
  AppendIfPresent(out, "binning_y", patch.binning_y);
  AppendIfPresent(out, "roi_x", patch.roi_x);
  AppendIfPresent(out, "roi_y", patch.roi_y);
  AppendIfPresent(out, "roi_width", patch.roi_width);
  AppendIfPresent(out, "roi_height", patch.roi_height);
  AppendIfPresent(out, "trigger_type", patch.trigger_type);
  AppendIfPresent(out, "trigger_count", patch.trigger_count);
  AppendIfPresent(out, "frame_queue_size", patch.frame_queue_size);
  AppendIfPresent(out, "gain", patch.gain);
  AppendIfPresent(out, "black_level", patch.black_level);
  AppendIfPresent(out, "freq", patch.freq);
  AppendIfPresent(out, "taps", patch.taps);
  AppendIfPresent(out, "color_gain", patch.color_gain);
  return json::MakeObject(std::move(out));
}

json::Value ToJson(const SettingsSnapshot& snapshot) {
  json::Value out = ToJson(FullPatch(snapshot.values));
  auto& members = out.object_value;
  members["exposure_range"] = RangeToJson(snapshot.exposure_range);
  members["binning_x_range"] = RangeToJson(snapshot.binning_x_range);
  members["binning_y_range"] = RangeToJson(snapshot.binning_y_range);
  members["gain_range"] = RangeToJson(snapshot.gain_range);
  members["black_level_range"] = RangeToJson(snapshot.black_level_range);
  members["sensor_size"] =
      json::MakeArray({ToJsonValue(snapshot.sensor_size[0]), ToJsonValue(snapshot.sensor_size[1])});
  members["supported_freqs"] = ToJsonValue(snapshot.supported_freqs);
  members["supported_taps"] = ToJsonValue(snapshot.supported_taps);
  members["supported_triggers"] = ToJsonValue(snapshot.supported_triggers);
  members["supports_color"] = json::MakeBool(snapshot.supports_color);
  return out;
}

bool PatchFromJson(const json::Value& value, SettingsPatch& patch, std::string& error) {
  if (value.type != json::Value::Type::kObject) {
    error = "settings payload must be a mapping";
    return false;
  }
  return ReadMember(value, "exposure_ms", patch.exposure_ms, error) &&
         ReadMember(value, "binning_x", patch.binning_x, error) &&
         ReadMember(value, "binning_y", patch.binning_y, error) &&
         ReadMember(value, "roi_x", patch.roi_x, error) &&
         ReadMember(value, "roi_y", patch.roi_y, error) &&
         ReadMember(value, "roi_width", patch.roi_width, error) &&
         ReadMember(value, "roi_height", patch.roi_height, error) &&
         ReadMember(value, "trigger_type", patch.trigger_type, error) &&
         ReadMember(value, "trigger_count", patch.trigger_count, error) &&
         ReadMember(value, "frame_queue_size", patch.frame_queue_size, error) &&
         ReadMember(value, "gain", patch.gain, error) &&
         ReadMember(value, "black_level", patch.black_level, error) &&
         ReadMember(value, "freq", patch.freq, error) &&
         ReadMember(value, "taps", patch.taps, error) &&
         ReadMember(value, "color_gain", patch.color_gain, error);
}

bool MergeSnapshotJson(const json::Value& value, SettingsSnapshot& snapshot,
                       std::vector<std::string>& updated, std::string& error) {
  SettingsPatch patch;
  if (!PatchFromJson(value, patch, error)) {
    return false;
  }

  std::optional<Range<double>> exposure_range;
  std::optional<Range<std::int64_t>> binning_x_range;
  std::optional<Range<std::int64_t>> binning_y_range;
  std::optional<Range<std::int64_t>> gain_range;
  std::optional<Range<std::int64_t>> black_level_range;
  std::optional<std::array<std::int64_t, 2>> sensor_size;
  std::optional<std::vector<std::string>> supported_freqs;
  std::optional<std::vector<std::string>> supported_taps;
  std::optional<std::vector<std::string>> supported_triggers;
  std::optional<bool> supports_color;
  if (!ReadMember(value, "exposure_range", exposure_range, error) ||
      !ReadMember(value, "binning_x_range", binning_x_range, error) ||
      !ReadMember(value, "binning_y_range", binning_y_range, error) ||
      !ReadMember(value, "gain_range", gain_range, error) ||
      !ReadMember(value, "black_level_range", black_level_range, error) ||
      !ReadMember(value, "sensor_size", sensor_size, error) ||
      !ReadMember(value, "supported_freqs", supported_freqs, error) ||
      !ReadMember(value, "supported_taps", supported_taps, error) ||
      !ReadMember(value, "supported_triggers", supported_triggers, error) ||
      !ReadMember(value, "supports_color", supports_color, error)) {
    return false;
  }

  updated = MergeSettings(snapshot.values, patch);

  const auto assign = [&updated](std::string_view name, auto& source, auto& target) {
    if (source.has_value()) {
      target = std::move(source.value());
      updated.emplace_back(name);
    }
  };
  assign("exposure_range", exposure_range, snapshot.exposure_range);
  assign("binning_x_range", binning_x_range, snapshot.binning_x_range);
  assign("binning_y_range", binning_y_range, snapshot.binning_y_range);
  assign("gain_range", gain_range, snapshot.gain_range);
  assign("black_level_range", black_level_range, snapshot.black_level_range);
  assign("sensor_size", sensor_size, snapshot.sensor_size);
  assign("supported_freqs", supported_freqs, snapshot.supported_freqs);
  assign("supported_taps", supported_taps, snapshot.supported_taps);
  assign("supported_triggers", supported_triggers, snapshot.supported_triggers);
  assign("supports_color", supports_color, snapshot.supports_color);
  return true;
}

} // namespace camhost::core::schema
