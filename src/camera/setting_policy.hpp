#pragma once

#include "core/json_dom.hpp"
#include "core/schema/settings_snapshot.hpp"

#include <string>
#include <string_view>

namespace camhost::camera {

// Outcome of the state guard. `reason` is the client-facing message when
// `ok` is false.
struct SettingCheck {
  bool ok = true;
  std::string reason;
};

// While playing only `kPlaySettings` may change; otherwise any name in
// `kAllSettings`. Never touches the driver.
SettingCheck ValidateSettingWrite(bool playing, std::string_view name);

// Coerces `value` and applies the camera's limits against `snapshot`,
// producing the fields to hand to the driver. Derived fields are included:
// moving the ROI origin also carries the (possibly shrunk) extent and
// resizing the ROI carries the origin it was measured from. A value of the
// wrong type, or an enumeration outside the advertised list, fails without
// touching `plan`.
bool PlanSettingWrite(const core::schema::SettingsSnapshot& snapshot, std::string_view name,
                      const core::json::Value& value, core::schema::SettingsPatch& plan,
                      std::string& error);

} // namespace camhost::camera
