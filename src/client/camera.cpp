#include "client/camera.hpp"

#include <utility>

namespace camhost::client {

using protocol::Message;
using protocol::Tag;

Camera::Camera(ClientOptions options, core::logging::Logger& logger)
    : logger_(logger), client_(std::move(options), *this, logger) {}

Camera::~Camera() {
  // The client threads call back into this object; stop them first.
  client_.StopProcess(true);
}

bool Camera::Start(std::string& error) {
  return client_.StartProcess(error);
}

void Camera::Stop(bool join, double kill_delay_s) {
  client_.StopProcess(join, kill_delay_s);
}

void Camera::OpenCamera(const std::string& serial) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_.serial = serial;
  }
  client_.SendRequest(protocol::MakeOpenCam(serial));
}

void Camera::CloseCamera() {
  client_.SendRequest(protocol::MakeMessage(Tag::kCloseCam));
}

void Camera::RefreshCameras() {
  client_.SendRequest(protocol::MakeMessage(Tag::kSerials));
}

void Camera::PlayCamera() {
  client_.SendRequest(protocol::MakeMessage(Tag::kPlay));
}

void Camera::StopPlayingCamera() {
  client_.SendRequest(protocol::MakeMessage(Tag::kStop));
}

void Camera::SetSetting(const std::string& name, core::json::Value value) {
  client_.SendRequest(protocol::MakeSettingRequest(name, std::move(value)));
}

CameraState Camera::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool Camera::WaitForState(const std::function<bool(const CameraState&)>& predicate,
                          std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return changed_.wait_for(lock, timeout, [&] { return predicate(state_); });
}

void Camera::OnMessage(Message message) {
  if (message.tag == Tag::kImage) {
    HandleImage(message);
    return;
  }

  if (message.tag == Tag::kException) {
    std::string text;
    std::string trace;
    std::string error;
    if (!protocol::ParseException(message, text, trace, error)) {
      text = "malformed exception event";
      trace = error;
    }
    OnException(text, trace);
    return;
  }

  ApplyEvent(message);
  if (on_event_) {
    on_event_(message.tag);
  }
}

void Camera::OnException(const std::string& message, const std::string& trace) {
  logger_.Error("camera error", {{"message", message}, {"trace", trace}});
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.errors.size() == kMaxRetainedErrors) {
      state_.errors.erase(state_.errors.begin());
    }
    state_.errors.push_back(message);
    ++state_.error_count;
  }
  changed_.notify_all();
  if (on_error_) {
    on_error_(message, trace);
  }
}

void Camera::HandleImage(const Message& message) {
  core::schema::FrameEnvelope frame;
  std::string error;
  if (!protocol::ParseImageMessage(message, frame, error)) {
    OnException("Malformed image event", error);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++state_.frames_received;
    state_.last_frame_index = frame.frame_index;
  }
  changed_.notify_all();
  if (on_image_) {
    on_image_(frame);
  }
}

void Camera::ApplyEvent(const Message& message) {
  std::string error;
  std::unique_lock<std::mutex> lock(mu_);
  switch (message.tag) {
  case Tag::kSerials: {
    std::vector<std::string> serials;
    if (!protocol::ParseSerials(message, serials, error)) {
      break;
    }
    state_.serials = std::move(serials);
    state_.serials_received = true;
    break;
  }
  case Tag::kCamOpen:
    state_.cam_open = true;
    break;
  case Tag::kCamClosed:
    state_.cam_open = false;
    state_.cam_playing = false;
    state_.serial.clear();
    ++state_.closed_count;
    break;
  case Tag::kPlaying: {
    bool playing = false;
    if (protocol::ParsePlaying(message, playing, error)) {
      state_.cam_playing = playing;
    }
    break;
  }
  case Tag::kSettings:
  case Tag::kSetting: {
    std::vector<std::string> updated;
    if (core::schema::MergeSnapshotJson(message.value, state_.settings, updated, error)) {
      for (const std::string& name : updated) {
        logger_.Debug("setting updated", {{"name", name}});
      }
    }
    break;
  }
  default:
    error = std::string("unexpected event '") + protocol::ToString(message.tag) + "'";
    break;
  }
  lock.unlock();
  changed_.notify_all();

  if (!error.empty()) {
    OnException("Malformed event from the worker", error);
  }
}

} // namespace camhost::client
