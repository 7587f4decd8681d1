#pragma once

#include "core/json_dom.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camhost::core::schema {

inline constexpr std::string_view kSoftwareTrigger = "SW Trigger";
inline constexpr std::string_view kHardwareTrigger = "HW Trigger";

// Every setting a camera session recognizes, in wire-name form.
inline constexpr std::array<std::string_view, 15> kAllSettings = {
    "exposure_ms", "binning_x",  "binning_y",        "roi_x",       "roi_y",
    "roi_width",   "roi_height", "trigger_type",     "trigger_count", "frame_queue_size",
    "gain",        "black_level", "freq",            "taps",        "color_gain",
};

// Subset that may change while frames are streaming.
inline constexpr std::array<std::string_view, 4> kPlaySettings = {
    "exposure_ms",
    "gain",
    "black_level",
    "color_gain",
};

bool IsKnownSetting(std::string_view name);
bool IsPlaySetting(std::string_view name);

using ColorGain = std::array<double, 3>;

// Current camera configuration, one typed field per recognized setting.
struct Settings {
  double exposure_ms = 5.0;
  std::int64_t binning_x = 0;
  std::int64_t binning_y = 0;
  std::int64_t roi_x = 0;
  std::int64_t roi_y = 0;
  std::int64_t roi_width = 0;
  std::int64_t roi_height = 0;
  std::string trigger_type = std::string(kSoftwareTrigger);
  std::int64_t trigger_count = 1;
  std::int64_t frame_queue_size = 1;
  std::int64_t gain = 0;
  std::int64_t black_level = 0;
  std::string freq = "20 MHz";
  std::string taps = "1";
  ColorGain color_gain = {1.0, 1.0, 1.0};
};

// Partial update of `Settings`. A present field is a value to write (when
// sent to the driver) or a value that was written (when echoed to clients).
struct SettingsPatch {
  std::optional<double> exposure_ms;
  std::optional<std::int64_t> binning_x;
  std::optional<std::int64_t> binning_y;
  std::optional<std::int64_t> roi_x;
  std::optional<std::int64_t> roi_y;
  std::optional<std::int64_t> roi_width;
  std::optional<std::int64_t> roi_height;
  std::optional<std::string> trigger_type;
  std::optional<std::int64_t> trigger_count;
  std::optional<std::int64_t> frame_queue_size;
  std::optional<std::int64_t> gain;
  std::optional<std::int64_t> black_level;
  std::optional<std::string> freq;
  std::optional<std::string> taps;
  std::optional<ColorGain> color_gain;

  bool empty() const;
};

template <typename T>
struct Range {
  T min{};
  T max{};
};

// Settings plus the capability/range data a driver advertises for them.
struct SettingsSnapshot {
  Settings values;
  Range<double> exposure_range{0.0, 100.0};
  Range<std::int64_t> binning_x_range{0, 0};
  Range<std::int64_t> binning_y_range{0, 0};
  Range<std::int64_t> gain_range{0, 100};
  Range<std::int64_t> black_level_range{0, 100};
  std::array<std::int64_t, 2> sensor_size = {0, 0};
  std::vector<std::string> supported_freqs = {"20 MHz"};
  std::vector<std::string> supported_taps = {"1"};
  std::vector<std::string> supported_triggers = {std::string(kSoftwareTrigger),
                                                 std::string(kHardwareTrigger)};
  bool supports_color = false;
};

// Applies every present patch field and returns the names whose value
// actually changed, in `kAllSettings` order.
std::vector<std::string> MergeSettings(Settings& settings, const SettingsPatch& patch);

// Wire conversion. Settings travel as a flat object keyed by setting name;
// ranges use `<name>_range` two-element arrays.
json::Value ToJson(const SettingsPatch& patch);
json::Value ToJson(const SettingsSnapshot& snapshot);

// Reads the fields present in `value` into `patch`. Unknown keys are ignored
// so older clients tolerate newer servers.
bool PatchFromJson(const json::Value& value, SettingsPatch& patch, std::string& error);

// Merges a `settings` or `setting` payload into a client-side snapshot,
// including range/capability keys when present.
bool MergeSnapshotJson(const json::Value& value, SettingsSnapshot& snapshot,
                       std::vector<std::string>& updated, std::string& error);

} // namespace camhost::core::schema
