#pragma once

#include "client/camera_client.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "core/schema/frame_envelope.hpp"
#include "core/schema/settings_snapshot.hpp"
#include "protocol/message.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace camhost::client {

// Copy of the facade state at one point in time.
struct CameraState {
  std::vector<std::string> serials;
  bool serials_received = false;
  bool cam_open = false;
  bool cam_playing = false;
  // Serial requested by the last OpenCamera; cleared on `cam_closed`.
  std::string serial;
  core::schema::SettingsSnapshot settings;
  std::uint64_t frames_received = 0;
  std::uint64_t last_frame_index = 0;
  std::uint64_t closed_count = 0;
  // Most recent error messages, oldest first, at most
  // Camera::kMaxRetainedErrors of them. `error_count` counts all of them.
  std::vector<std::string> errors;
  std::uint64_t error_count = 0;
};

// Application-level camera handle on top of CameraClient.
//
// Handlers are invoked on the client thread (errors may also come from the
// process-watch thread) and must be installed before Start. State readers on
// other threads use State() or WaitForState().
class Camera final : public IClientListener {
public:
  using ImageHandler = std::function<void(const core::schema::FrameEnvelope&)>;
  using ErrorHandler = std::function<void(const std::string& message, const std::string& trace)>;
  using EventHandler = std::function<void(protocol::Tag tag)>;

  Camera(ClientOptions options, core::logging::Logger& logger);
  ~Camera() override;

  Camera(const Camera&) = delete;
  Camera& operator=(const Camera&) = delete;

  static constexpr std::size_t kMaxRetainedErrors = 16;

  void SetImageHandler(ImageHandler handler) { on_image_ = std::move(handler); }
  void SetErrorHandler(ErrorHandler handler) { on_error_ = std::move(handler); }
  // Called after the state change of every non-image event is applied.
  void SetEventHandler(EventHandler handler) { on_event_ = std::move(handler); }

  bool Start(std::string& error);
  void Stop(bool join = true, double kill_delay_s = CameraClient::kDefaultKillDelay);

  void OpenCamera(const std::string& serial);
  void CloseCamera();
  void RefreshCameras();
  void PlayCamera();
  void StopPlayingCamera();
  void SetSetting(const std::string& name, core::json::Value value);

  CameraState State() const;

  // Blocks until `predicate` holds for the current state or `timeout`
  // passes. Returns the final predicate result.
  bool WaitForState(const std::function<bool(const CameraState&)>& predicate,
                    std::chrono::milliseconds timeout) const;

  bool process_connected() const { return client_.process_connected(); }
  bool process_running() const { return client_.process_running(); }
  std::optional<int> worker_exit_code() const { return client_.exit_code(); }

  void OnMessage(protocol::Message message) override;
  void OnException(const std::string& message, const std::string& trace) override;

private:
  void HandleImage(const protocol::Message& message);
  void ApplyEvent(const protocol::Message& message);

  core::logging::Logger& logger_;
  CameraClient client_;

  ImageHandler on_image_;
  ErrorHandler on_error_;
  EventHandler on_event_;

  mutable std::mutex mu_;
  mutable std::condition_variable changed_;
  CameraState state_;
};

} // namespace camhost::client
