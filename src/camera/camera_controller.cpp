#include "camera/camera_controller.hpp"

#include "camera/setting_policy.hpp"
#include "driver/error_mapper.hpp"

#include <utility>

namespace camhost::camera {

namespace schema = core::schema;
using protocol::Message;
using protocol::Tag;

CameraController::CameraController(std::unique_ptr<driver::ICameraDriver> driver,
                                   std::string serial, ControllerOptions options,
                                   core::logging::Logger& logger)
    : driver_(std::move(driver)),
      serial_(std::move(serial)),
      options_(options),
      logger_(logger) {}

CameraController::~CameraController() {
  if (thread_.joinable()) {
    // The loop only exits through the close path.
    requests_.Put(protocol::MakeMessage(Tag::kCloseCam));
    thread_.join();
  }
}

void CameraController::Start() {
  thread_ = std::thread([this] { Run(); });
}

void CameraController::SendRequest(Message request) {
  requests_.Put(std::move(request));
}

std::optional<Message> CameraController::TryGetEvent() {
  return events_.TryGet();
}

void CameraController::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void CameraController::Run() {
  logger_.Info("control loop starting", {{"serial", serial_}});

  std::string error;
  Outcome outcome = Outcome::kContinue;
  if (!driver_->Open(serial_, error)) {
    outcome = DriverFailure("open", error);
  } else if (!driver_->ReadSettings(snapshot_, error)) {
    outcome = DriverFailure("read_settings", error);
  } else {
    Emit(protocol::MakeMessage(Tag::kSettings, schema::ToJson(snapshot_)));
    Emit(protocol::MakeMessage(Tag::kCamOpen));
  }

  while (outcome == Outcome::kContinue) {
    if (!playing_) {
      // Idle: nothing is produced until the next request.
      outcome = HandleRequest(requests_.Get());
      continue;
    }

    while (outcome == Outcome::kContinue && playing_) {
      std::optional<Message> request = requests_.TryGet();
      if (!request.has_value()) {
        break;
      }
      outcome = HandleRequest(*request);
    }
    if (outcome != Outcome::kContinue || !playing_) {
      continue;
    }

    bool produced = false;
    outcome = PollOnce(produced);
    if (outcome == Outcome::kContinue && !produced) {
      std::this_thread::sleep_for(options_.poll_interval);
    }
  }

  accepting_.store(false);
  Shutdown();
  Emit(protocol::MakeMessage(Tag::kCamClosed));
  finished_.store(true);
  logger_.Info("control loop exited", {{"serial", serial_}});
}

CameraController::Outcome CameraController::HandleRequest(const Message& request) {
  switch (request.tag) {
  case Tag::kCloseCam:
    return Outcome::kClose;
  case Tag::kPlay:
    return HandlePlay();
  case Tag::kStop:
    return HandleStop();
  case Tag::kSetting:
    return HandleSetting(request);
  default:
    ReportException(std::string("Request '") + protocol::ToString(request.tag) +
                        "' is not handled by an open camera",
                    std::string("state=") + StateName());
    return Outcome::kContinue;
  }
}

CameraController::Outcome CameraController::HandlePlay() {
  if (playing_) {
    ReportException("Camera is already playing", std::string("state=") + StateName());
    return Outcome::kContinue;
  }

  std::string error;
  if (!driver_->Arm(error)) {
    return DriverFailure("arm", error);
  }
  if (snapshot_.values.trigger_type == schema::kSoftwareTrigger &&
      !driver_->IssueSoftwareTrigger(error)) {
    return DriverFailure("software_trigger", error);
  }
  playing_ = true;
  Emit(protocol::MakePlaying(true));
  return Outcome::kContinue;
}

CameraController::Outcome CameraController::HandleStop() {
  if (!playing_) {
    ReportException("Camera is not playing", std::string("state=") + StateName());
    return Outcome::kContinue;
  }

  std::string error;
  if (!driver_->Disarm(error)) {
    return DriverFailure("disarm", error);
  }
  playing_ = false;
  Emit(protocol::MakePlaying(false));
  return Outcome::kContinue;
}

CameraController::Outcome CameraController::HandleSetting(const Message& request) {
  std::string name;
  core::json::Value value;
  std::string error;
  if (!protocol::ParseSettingRequest(request, name, value, error)) {
    ReportException(error, std::string("state=") + StateName());
    return Outcome::kContinue;
  }

  const SettingCheck check = ValidateSettingWrite(playing_, name);
  if (!check.ok) {
    ReportException(check.reason, std::string("setting=") + name + " state=" + StateName());
    return Outcome::kContinue;
  }

  schema::SettingsPatch plan;
  if (!PlanSettingWrite(snapshot_, name, value, plan, error)) {
    ReportException(error, std::string("setting=") + name + " state=" + StateName());
    return Outcome::kContinue;
  }

  if (!driver_->WriteSettings(plan, error)) {
    return DriverFailure("write_setting", error);
  }
  schema::MergeSettings(snapshot_.values, plan);
  Emit(protocol::MakeMessage(Tag::kSetting, schema::ToJson(plan)));
  return Outcome::kContinue;
}

CameraController::Outcome CameraController::PollOnce(bool& produced) {
  std::optional<schema::FrameEnvelope> frame;
  std::string error;
  if (!driver_->PollFrame(frame, error)) {
    return DriverFailure("poll_frame", error);
  }
  produced = frame.has_value();
  if (produced) {
    Emit(protocol::MakeImageMessage(std::move(*frame)));
  }
  return Outcome::kContinue;
}

CameraController::Outcome CameraController::DriverFailure(const char* operation,
                                                          const std::string& detail) {
  const std::string message = driver::FormatDriverError(operation, detail);
  const std::string trace = std::string("driver call failed\n  operation=") + operation +
                            "\n  serial=" + serial_ + "\n  state=" + StateName() +
                            "\n  detail=" + detail;
  logger_.Error("driver failure; closing session",
                {{"serial", serial_}, {"operation", operation}, {"error", message}});
  // Cleared before the exception goes out so no request sent in reaction to
  // it can be queued behind the exiting loop.
  accepting_.store(false);
  Emit(protocol::MakeException(message, trace));
  return Outcome::kDriverFailure;
}

void CameraController::ReportException(const std::string& message, const std::string& trace) {
  logger_.Warn("request rejected", {{"serial", serial_}, {"reason", message}});
  Emit(protocol::MakeException(message, trace));
}

// Best effort: the session ends regardless, failures are only logged.
void CameraController::Shutdown() {
  std::string error;
  if (driver_->IsArmed() && !driver_->Disarm(error)) {
    logger_.Warn("disarm during close failed", {{"serial", serial_}, {"error", error}});
  }
  error.clear();
  if (!driver_->Close(error)) {
    logger_.Warn("driver close failed", {{"serial", serial_}, {"error", error}});
  }
  playing_ = false;
}

void CameraController::Emit(Message event) {
  events_.Put(std::move(event));
}

const char* CameraController::StateName() const {
  return playing_ ? "playing" : "idle";
}

} // namespace camhost::camera
