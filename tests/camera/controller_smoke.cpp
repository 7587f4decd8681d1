#include "camera/camera_controller.hpp"
#include "common/assertions.hpp"
#include "core/json_writer.hpp"
#include "core/logging/logger.hpp"
#include "driver/camera_driver.hpp"
#include "protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using camhost::tests::common::AssertContains;
using camhost::tests::common::AssertTags;
using camhost::tests::common::Fail;

namespace camera = camhost::camera;
namespace json = camhost::core::json;
namespace protocol = camhost::protocol;
namespace schema = camhost::core::schema;
using protocol::Tag;

namespace {

struct DriverCalls {
  std::atomic<int> open{0};
  std::atomic<int> close{0};
  std::atomic<int> arm{0};
  std::atomic<int> trigger{0};
  std::atomic<int> disarm{0};
  std::atomic<int> read_settings{0};
  std::atomic<int> write_settings{0};
  std::atomic<int> poll{0};
};

struct DriverScript {
  bool fail_open = false;
  // PollFrame fails once this many frames were produced; 0 never fails.
  std::uint64_t fail_after_frames = 0;
  // WriteSettings fails after counting the call.
  bool fail_write = false;
  // Close blocks while this is set.
  std::shared_ptr<std::atomic<bool>> hold_close;
};

// Scripted driver: produces a 2x1 mono16 frame every 2 ms while armed.
class ScriptedDriver final : public camhost::driver::ICameraDriver {
public:
  ScriptedDriver(DriverScript script, std::shared_ptr<DriverCalls> calls)
      : script_(script), calls_(std::move(calls)) {
    snapshot_.sensor_size = {2, 1};
    snapshot_.values.roi_width = 2;
    snapshot_.values.roi_height = 1;
  }

  bool DiscoverSerials(std::vector<std::string>& serials, std::string& error) override {
    (void)error;
    serials = {"mock-1"};
    return true;
  }

  bool Open(const std::string& serial, std::string& error) override {
    ++calls_->open;
    if (script_.fail_open) {
      error = "camera with serial '" + serial + "' not found";
      return false;
    }
    return true;
  }

  bool Close(std::string& error) override {
    (void)error;
    while (script_.hold_close != nullptr && script_.hold_close->load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ++calls_->close;
    armed_ = false;
    return true;
  }

  bool Arm(std::string& error) override {
    (void)error;
    ++calls_->arm;
    armed_ = true;
    return true;
  }

  bool IssueSoftwareTrigger(std::string& error) override {
    (void)error;
    ++calls_->trigger;
    return true;
  }

  bool Disarm(std::string& error) override {
    (void)error;
    ++calls_->disarm;
    armed_ = false;
    return true;
  }

  bool IsArmed() const override { return armed_; }

  bool ReadSettings(schema::SettingsSnapshot& snapshot, std::string& error) override {
    (void)error;
    ++calls_->read_settings;
    snapshot = snapshot_;
    return true;
  }

  bool WriteSettings(const schema::SettingsPatch& patch, std::string& error) override {
    ++calls_->write_settings;
    if (script_.fail_write) {
      error = "parameter rejected by device";
      return false;
    }
    schema::MergeSettings(snapshot_.values, patch);
    return true;
  }

  bool PollFrame(std::optional<schema::FrameEnvelope>& frame, std::string& error) override {
    ++calls_->poll;
    frame.reset();
    if (script_.fail_after_frames > 0U && produced_ >= script_.fail_after_frames) {
      error = "camera disconnected (cable pulled)";
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - last_frame_ < kFramePeriod) {
      return true;
    }
    last_frame_ = now;
    schema::FrameEnvelope envelope;
    envelope.width = 2;
    envelope.height = 1;
    envelope.frame_index = ++produced_;
    envelope.pixel_bytes = {0, 0, 1, 0};
    frame = std::move(envelope);
    return true;
  }

private:
  static constexpr std::chrono::milliseconds kFramePeriod{2};

  DriverScript script_;
  std::shared_ptr<DriverCalls> calls_;
  schema::SettingsSnapshot snapshot_;
  bool armed_ = false;
  std::uint64_t produced_ = 0;
  std::chrono::steady_clock::time_point last_frame_{};
};

struct Session {
  std::shared_ptr<DriverCalls> calls = std::make_shared<DriverCalls>();
  std::unique_ptr<camera::CameraController> controller;
};

Session StartSession(camhost::core::logging::Logger& logger, DriverScript script = {}) {
  Session session;
  session.controller = std::make_unique<camera::CameraController>(
      std::make_unique<ScriptedDriver>(script, session.calls), "mock-1",
      camera::ControllerOptions{}, logger);
  session.controller->Start();
  return session;
}

// Collects events until `count` non-image events arrived. Images are counted
// separately and their indices checked for strict increase.
std::vector<protocol::Message> NextEvents(camera::CameraController& controller, std::size_t count,
                                          std::uint64_t* images = nullptr) {
  std::vector<protocol::Message> events;
  std::uint64_t last_index = 0;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (events.size() < count) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Fail("timed out waiting for controller events; got " +
           camhost::tests::common::DescribeTags(events));
    }
    std::optional<protocol::Message> event =
        controller.GetEventFor(std::chrono::milliseconds(50));
    if (!event.has_value()) {
      continue;
    }
    if (event->tag == Tag::kImage) {
      schema::FrameEnvelope frame;
      std::string error;
      if (!protocol::ParseImageMessage(*event, frame, error)) {
        Fail("controller emitted a malformed image: " + error);
      }
      if (frame.frame_index <= last_index) {
        Fail("frame indices must strictly increase");
      }
      last_index = frame.frame_index;
      if (images != nullptr) {
        ++*images;
      }
      continue;
    }
    events.push_back(std::move(*event));
  }
  return events;
}

// Waits for the next image; any other event first is a failure.
void AwaitImage(camera::CameraController& controller, std::uint64_t& images) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    std::optional<protocol::Message> event =
        controller.GetEventFor(std::chrono::milliseconds(50));
    if (!event.has_value()) {
      continue;
    }
    if (event->tag != Tag::kImage) {
      Fail(std::string("expected an image, got ") + protocol::ToString(event->tag));
    }
    ++images;
    return;
  }
  Fail("timed out waiting for an image");
}

std::string ExceptionText(const protocol::Message& event) {
  std::string text;
  std::string trace;
  std::string error;
  if (!protocol::ParseException(event, text, trace, error)) {
    Fail("malformed exception event: " + error);
  }
  return text;
}

std::string EncodeValue(const json::Value& value) {
  std::string out;
  std::string error;
  if (!json::Serialize(value, out, error)) {
    Fail("serialize failed: " + error);
  }
  return out;
}

void AssertNoMoreEvents(camera::CameraController& controller) {
  controller.Join();
  if (controller.TryGetEvent().has_value()) {
    Fail("cam_closed must be the last event of a session");
  }
}

void CheckOpenRejectAndOrder(camhost::core::logging::Logger& logger) {
  Session session = StartSession(logger);
  camera::CameraController& controller = *session.controller;

  AssertTags(NextEvents(controller, 2), {Tag::kSettings, Tag::kCamOpen}, "open");

  // Rejections never reach the driver.
  controller.SendRequest(protocol::MakeSettingRequest("shutter_angle", json::MakeInteger(1)));
  controller.SendRequest(protocol::MakeSettingRequest("gain", json::MakeString("high")));
  controller.SendRequest(protocol::MakeMessage(Tag::kStop));
  const std::vector<protocol::Message> rejected = NextEvents(controller, 3);
  AssertTags(rejected, {Tag::kException, Tag::kException, Tag::kException}, "rejections");
  AssertContains(ExceptionText(rejected[0]), "Setting \"shutter_angle\" is not recognized");
  AssertContains(ExceptionText(rejected[1]), "expected a number, got string");
  AssertContains(ExceptionText(rejected[2]), "Camera is not playing");
  if (session.calls->write_settings.load() != 0 || session.calls->disarm.load() != 0) {
    Fail("rejected requests must not call the driver");
  }

  // Echoes come back in request order with the applied value.
  controller.SendRequest(protocol::MakeSettingRequest("exposure_ms", json::MakeInteger(500)));
  controller.SendRequest(protocol::MakeSettingRequest("gain", json::MakeInteger(7)));
  controller.SendRequest(protocol::MakeSettingRequest("roi_x", json::MakeInteger(1)));
  const std::vector<protocol::Message> echoes = NextEvents(controller, 3);
  AssertTags(echoes, {Tag::kSetting, Tag::kSetting, Tag::kSetting}, "echoes");
  if (EncodeValue(echoes[0].value) != R"({"exposure_ms":100.0})" ||
      EncodeValue(echoes[1].value) != R"({"gain":7})" ||
      EncodeValue(echoes[2].value) != R"({"roi_width":1,"roi_x":1})") {
    Fail("unexpected echo payloads: " + EncodeValue(echoes[0].value) + " " +
         EncodeValue(echoes[1].value) + " " + EncodeValue(echoes[2].value));
  }
  if (session.calls->write_settings.load() != 3) {
    Fail("each accepted setting must be written exactly once");
  }

  controller.SendRequest(protocol::MakeMessage(Tag::kCloseCam));
  AssertTags(NextEvents(controller, 1), {Tag::kCamClosed}, "close");
  AssertNoMoreEvents(controller);
  if (session.calls->close.load() != 1 || session.calls->disarm.load() != 0) {
    Fail("idle close must close without disarming");
  }
}

void CheckPlayCycle(camhost::core::logging::Logger& logger) {
  Session session = StartSession(logger);
  camera::CameraController& controller = *session.controller;
  AssertTags(NextEvents(controller, 2), {Tag::kSettings, Tag::kCamOpen}, "open");

  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  std::uint64_t images = 0;
  const std::vector<protocol::Message> started = NextEvents(controller, 1, &images);
  AssertTags(started, {Tag::kPlaying}, "play");
  bool playing = false;
  std::string error;
  if (!protocol::ParsePlaying(started[0], playing, error) || !playing) {
    Fail("play must answer playing:true");
  }
  if (session.calls->arm.load() != 1 || session.calls->trigger.load() != 1) {
    Fail("play in software trigger mode must arm then trigger once");
  }

  const int writes_before = session.calls->write_settings.load();
  controller.SendRequest(protocol::MakePlaying(true));
  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  controller.SendRequest(protocol::MakeSettingRequest("binning_x", json::MakeInteger(2)));
  controller.SendRequest(protocol::MakeSettingRequest("gain", json::MakeInteger(3)));
  const std::vector<protocol::Message> during = NextEvents(controller, 4, &images);
  AssertTags(during, {Tag::kException, Tag::kException, Tag::kException, Tag::kSetting},
             "requests while playing");
  AssertContains(ExceptionText(during[1]), "Camera is already playing");
  AssertContains(ExceptionText(during[2]),
                 "Setting \"binning_x\" cannot be set while the camera is playing");
  if (session.calls->write_settings.load() != writes_before + 1 ||
      session.calls->arm.load() != 1) {
    Fail("only the play-safe setting may reach the driver while playing");
  }

  // Frames come from polls between request drains; see one before stopping.
  AwaitImage(controller, images);
  controller.SendRequest(protocol::MakeMessage(Tag::kStop));
  const std::vector<protocol::Message> stopped = NextEvents(controller, 1, &images);
  AssertTags(stopped, {Tag::kPlaying}, "stop");
  if (!protocol::ParsePlaying(stopped[0], playing, error) || playing) {
    Fail("stop must answer playing:false");
  }
  if (images == 0U) {
    Fail("expected frames while playing");
  }

  controller.SendRequest(protocol::MakeMessage(Tag::kCloseCam));
  AssertTags(NextEvents(controller, 1), {Tag::kCamClosed}, "close");
  AssertNoMoreEvents(controller);
}

void CheckCloseWhilePlaying(camhost::core::logging::Logger& logger) {
  Session session = StartSession(logger);
  camera::CameraController& controller = *session.controller;
  AssertTags(NextEvents(controller, 2), {Tag::kSettings, Tag::kCamOpen}, "open");

  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  controller.SendRequest(protocol::MakeMessage(Tag::kCloseCam));
  AssertTags(NextEvents(controller, 2), {Tag::kPlaying, Tag::kCamClosed}, "close while playing");
  AssertNoMoreEvents(controller);
  if (session.calls->disarm.load() != 1 || session.calls->close.load() != 1) {
    Fail("closing while playing must disarm then close");
  }
}

void CheckDriverFailure(camhost::core::logging::Logger& logger) {
  DriverScript script;
  script.fail_after_frames = 3;
  Session session = StartSession(logger, script);
  camera::CameraController& controller = *session.controller;
  AssertTags(NextEvents(controller, 2), {Tag::kSettings, Tag::kCamOpen}, "open");

  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  std::uint64_t images = 0;
  const std::vector<protocol::Message> events = NextEvents(controller, 3, &images);
  AssertTags(events, {Tag::kPlaying, Tag::kException, Tag::kCamClosed}, "driver failure");
  if (images != 3U) {
    Fail("expected exactly the frames produced before the failure");
  }
  AssertContains(ExceptionText(events[1]), "DEVICE_DISCONNECTED");
  AssertNoMoreEvents(controller);
  if (!controller.finished() || controller.accepting_requests() ||
      session.calls->disarm.load() != 1 ||
      session.calls->close.load() != 1) {
    Fail("driver failure must tear the session down");
  }

  // Requests after the end are never processed.
  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  if (controller.TryGetEvent().has_value()) {
    Fail("finished session must stay silent");
  }
}

void CheckWriteFailureWhilePlaying(camhost::core::logging::Logger& logger) {
  DriverScript script;
  script.fail_write = true;
  script.hold_close = std::make_shared<std::atomic<bool>>(true);
  Session session = StartSession(logger, script);
  camera::CameraController& controller = *session.controller;
  AssertTags(NextEvents(controller, 2), {Tag::kSettings, Tag::kCamOpen}, "open");

  controller.SendRequest(protocol::MakeMessage(Tag::kPlay));
  std::uint64_t images = 0;
  AssertTags(NextEvents(controller, 1, &images), {Tag::kPlaying}, "play");
  AwaitImage(controller, images);

  controller.SendRequest(protocol::MakeSettingRequest("gain", json::MakeInteger(3)));
  const std::vector<protocol::Message> failed = NextEvents(controller, 1, &images);
  AssertTags(failed, {Tag::kException}, "write failure");
  AssertContains(ExceptionText(failed[0]), "INVALID_CONFIGURATION");

  // The loop stops taking requests before its teardown, which is still held.
  if (!camhost::tests::common::WaitUntil([&controller] { return !controller.accepting_requests(); },
                                         std::chrono::seconds(5))) {
    Fail("a failed session must stop accepting requests");
  }
  if (controller.finished()) {
    Fail("teardown must still be pending while close is held");
  }
  script.hold_close->store(false);

  AssertTags(NextEvents(controller, 1, &images), {Tag::kCamClosed}, "teardown");
  AssertNoMoreEvents(controller);
  if (session.calls->write_settings.load() != 1 || session.calls->disarm.load() != 1 ||
      session.calls->close.load() != 1) {
    Fail("write failure must disarm then close once");
  }
}

void CheckOpenFailure(camhost::core::logging::Logger& logger) {
  DriverScript script;
  script.fail_open = true;
  Session session = StartSession(logger, script);
  camera::CameraController& controller = *session.controller;

  const std::vector<protocol::Message> events = NextEvents(controller, 2);
  AssertTags(events, {Tag::kException, Tag::kCamClosed}, "open failure");
  AssertContains(ExceptionText(events[0]), "DEVICE_NOT_FOUND");
  AssertNoMoreEvents(controller);
  if (session.calls->read_settings.load() != 0) {
    Fail("failed open must not read settings");
  }
}

} // namespace

int main() {
  camhost::core::logging::Logger logger(camhost::core::logging::LogLevel::kError);
  logger.SetComponent("controller_smoke");

  CheckOpenRejectAndOrder(logger);
  CheckPlayCycle(logger);
  CheckCloseWhilePlaying(logger);
  CheckDriverFailure(logger);
  CheckWriteFailureWhilePlaying(logger);
  CheckOpenFailure(logger);

  std::cout << "controller_smoke: ok\n";
  return 0;
}
