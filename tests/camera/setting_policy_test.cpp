#include "camera/setting_policy.hpp"
#include "core/json_writer.hpp"
#include "core/schema/settings_snapshot.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace camera = camhost::camera;
namespace json = camhost::core::json;
namespace schema = camhost::core::schema;

namespace {

schema::SettingsSnapshot MakeSnapshot() {
  schema::SettingsSnapshot snapshot;
  snapshot.sensor_size = {640, 480};
  snapshot.values.roi_x = 0;
  snapshot.values.roi_y = 0;
  snapshot.values.roi_width = 640;
  snapshot.values.roi_height = 480;
  snapshot.binning_x_range = {1, 4};
  snapshot.binning_y_range = {1, 4};
  snapshot.supported_freqs = {"20 MHz", "40 MHz"};
  snapshot.supported_taps = {"1", "2"};
  return snapshot;
}

std::string Encode(const schema::SettingsPatch& plan) {
  std::string out;
  std::string error;
  REQUIRE(json::Serialize(schema::ToJson(plan), out, error));
  return out;
}

} // namespace

TEST_CASE("Every known setting is writable while idle", "[camera][settings]") {
  for (const std::string_view name : schema::kAllSettings) {
    const camera::SettingCheck check = camera::ValidateSettingWrite(false, name);
    REQUIRE(check.ok);
  }

  const camera::SettingCheck unknown = camera::ValidateSettingWrite(false, "shutter_angle");
  REQUIRE_FALSE(unknown.ok);
  REQUIRE(unknown.reason == "Setting \"shutter_angle\" is not recognized");
}

TEST_CASE("Only play settings are writable while playing", "[camera][settings]") {
  std::vector<std::string_view> accepted;
  for (const std::string_view name : schema::kAllSettings) {
    const camera::SettingCheck check = camera::ValidateSettingWrite(true, name);
    if (check.ok) {
      accepted.push_back(name);
    } else {
      REQUIRE(check.reason == "Setting \"" + std::string(name) +
                                  "\" cannot be set while the camera is playing");
    }
  }
  REQUIRE(accepted == std::vector<std::string_view>(schema::kPlaySettings.begin(),
                                                    schema::kPlaySettings.end()));
  REQUIRE_FALSE(camera::ValidateSettingWrite(true, "shutter_angle").ok);
}

TEST_CASE("Exposure is clamped and truncated to whole microseconds", "[camera][settings]") {
  const schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;

  REQUIRE(camera::PlanSettingWrite(snapshot, "exposure_ms", json::MakeInteger(500), plan, error));
  REQUIRE(plan.exposure_ms == 100.0);
  REQUIRE(Encode(plan) == R"({"exposure_ms":100.0})");

  REQUIRE(camera::PlanSettingWrite(snapshot, "exposure_ms", json::MakeNumber(1.23456), plan,
                                   error));
  REQUIRE(plan.exposure_ms == 1.234);

  REQUIRE(camera::PlanSettingWrite(snapshot, "exposure_ms", json::MakeNumber(-4.0), plan, error));
  REQUIRE(plan.exposure_ms == 0.0);
}

TEST_CASE("Integer settings are clamped to advertised ranges", "[camera][settings]") {
  const schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;

  REQUIRE(camera::PlanSettingWrite(snapshot, "binning_x", json::MakeInteger(9), plan, error));
  REQUIRE(plan.binning_x == 4);
  REQUIRE(camera::PlanSettingWrite(snapshot, "gain", json::MakeNumber(55.9), plan, error));
  REQUIRE(plan.gain == 55);
  REQUIRE(camera::PlanSettingWrite(snapshot, "black_level", json::MakeInteger(-1), plan, error));
  REQUIRE(plan.black_level == 0);
  REQUIRE(camera::PlanSettingWrite(snapshot, "frame_queue_size", json::MakeInteger(0), plan,
                                   error));
  REQUIRE(plan.frame_queue_size == 1);
  REQUIRE(camera::PlanSettingWrite(snapshot, "trigger_count", json::MakeNumber(1e12), plan,
                                   error));
  REQUIRE(plan.trigger_count == 0x7FFFFFFF);
}

TEST_CASE("ROI origin carries the shrunk extent", "[camera][settings]") {
  schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;

  REQUIRE(camera::PlanSettingWrite(snapshot, "roi_x", json::MakeInteger(600), plan, error));
  REQUIRE(plan.roi_x == 600);
  REQUIRE(plan.roi_width == 40);
  REQUIRE_FALSE(plan.roi_y.has_value());

  REQUIRE(camera::PlanSettingWrite(snapshot, "roi_y", json::MakeInteger(5000), plan, error));
  REQUIRE(plan.roi_y == 479);
  REQUIRE(plan.roi_height == 1);

  snapshot.values.roi_x = 100;
  REQUIRE(camera::PlanSettingWrite(snapshot, "roi_width", json::MakeInteger(10000), plan, error));
  REQUIRE(plan.roi_width == 540);
  REQUIRE(plan.roi_x == 100);
  REQUIRE(Encode(plan) == R"({"roi_width":540,"roi_x":100})");

  REQUIRE(camera::PlanSettingWrite(snapshot, "roi_height", json::MakeInteger(0), plan, error));
  REQUIRE(plan.roi_height == 1);
  REQUIRE(plan.roi_y == 0);
}

TEST_CASE("Enumerated settings accept only advertised choices", "[camera][settings]") {
  const schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;

  REQUIRE(camera::PlanSettingWrite(snapshot, "freq", json::MakeString("40 MHz"), plan, error));
  REQUIRE(plan.freq == "40 MHz");
  REQUIRE(camera::PlanSettingWrite(snapshot, "trigger_type",
                                   json::MakeString(std::string(schema::kHardwareTrigger)), plan,
                                   error));
  REQUIRE(plan.trigger_type == std::string(schema::kHardwareTrigger));

  plan = schema::SettingsPatch{};
  REQUIRE_FALSE(camera::PlanSettingWrite(snapshot, "taps", json::MakeString("8"), plan, error));
  REQUIRE(error.find("'8' is not one of ['1', '2']") != std::string::npos);
  REQUIRE(plan.empty());

  REQUIRE_FALSE(camera::PlanSettingWrite(snapshot, "freq", json::MakeInteger(20), plan, error));
  REQUIRE(error == "invalid value for 'freq': expected a string, got integer");
}

TEST_CASE("Wrongly typed values are rejected", "[camera][settings]") {
  const schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;

  REQUIRE_FALSE(
      camera::PlanSettingWrite(snapshot, "exposure_ms", json::MakeString("fast"), plan, error));
  REQUIRE(error == "invalid value for 'exposure_ms': expected a number, got string");
  REQUIRE(plan.empty());
}

TEST_CASE("Color gain requires a color camera and three numbers", "[camera][settings]") {
  schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;
  const json::Value gain = json::MakeArray(
      {json::MakeNumber(10.0), json::MakeInteger(0), json::MakeInteger(0)});

  REQUIRE_FALSE(camera::PlanSettingWrite(snapshot, "color_gain", gain, plan, error));
  REQUIRE(error.find("does not support color") != std::string::npos);

  snapshot.supports_color = true;
  REQUIRE(camera::PlanSettingWrite(snapshot, "color_gain", gain, plan, error));
  REQUIRE(plan.color_gain == schema::ColorGain{10.0, 0.0, 0.0});

  REQUIRE_FALSE(camera::PlanSettingWrite(
      snapshot, "color_gain", json::MakeArray({json::MakeNumber(1.0)}), plan, error));
}

TEST_CASE("Merging reports only changed names", "[camera][settings]") {
  schema::SettingsSnapshot snapshot = MakeSnapshot();
  schema::SettingsPatch plan;
  std::string error;
  REQUIRE(camera::PlanSettingWrite(snapshot, "roi_x", json::MakeInteger(600), plan, error));

  const std::vector<std::string> changed = schema::MergeSettings(snapshot.values, plan);
  REQUIRE(changed == std::vector<std::string>{"roi_x", "roi_width"});
  REQUIRE(snapshot.values.roi_x == 600);
  REQUIRE(snapshot.values.roi_width == 40);

  REQUIRE(schema::MergeSettings(snapshot.values, plan).empty());
}

TEST_CASE("Client snapshot merges full and partial payloads", "[camera][settings]") {
  schema::SettingsSnapshot server = MakeSnapshot();
  server.values.exposure_ms = 12.5;
  server.supports_color = true;

  schema::SettingsSnapshot client;
  std::vector<std::string> updated;
  std::string error;
  REQUIRE(schema::MergeSnapshotJson(schema::ToJson(server), client, updated, error));
  REQUIRE(client.values.exposure_ms == 12.5);
  REQUIRE(client.values.roi_width == 640);
  REQUIRE(client.sensor_size == server.sensor_size);
  REQUIRE(client.supported_freqs == server.supported_freqs);
  REQUIRE(client.supports_color);

  schema::SettingsPatch echo;
  echo.exposure_ms = 100.0;
  REQUIRE(schema::MergeSnapshotJson(schema::ToJson(echo), client, updated, error));
  REQUIRE(updated == std::vector<std::string>{"exposure_ms"});
  REQUIRE(client.values.exposure_ms == 100.0);
  REQUIRE(client.values.roi_width == 640);

  REQUIRE_FALSE(schema::MergeSnapshotJson(json::MakeInteger(1), client, updated, error));
}
