#include "worker/camera_server.hpp"

#include "driver/driver_factory.hpp"
#include "driver/error_mapper.hpp"
#include "protocol/frame_io.hpp"

#include <chrono>
#include <utility>
#include <vector>

namespace camhost::worker {

using protocol::Message;
using protocol::Tag;

namespace {

constexpr auto kCloseDrainWait = std::chrono::milliseconds(100);

} // namespace

CameraServer::CameraServer(ServerOptions options, core::logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

CameraServer::~CameraServer() {
  CloseSession();
}

bool CameraServer::Prepare(std::string& error) {
  return driver::CreateCameraDriver(options_.driver_spec, discovery_driver_, error);
}

bool CameraServer::Listen(std::string& error) {
  if (!net::ListenTcp(options_.host, options_.port, listener_, error)) {
    return false;
  }
  if (!net::LocalPort(listener_, bound_port_, error)) {
    listener_.Reset();
    return false;
  }
  logger_.Info("listening", {{"host", options_.host}, {"port", std::to_string(bound_port_)}});
  return true;
}

bool CameraServer::Serve(std::string& error) {
  if (!listener_.valid()) {
    error = "server is not listening";
    return false;
  }
  if (!net::AcceptConnection(listener_, options_.accept_timeout_s, connection_, error)) {
    listener_.Reset();
    return false;
  }
  // One connection per worker lifetime.
  listener_.Reset();
  logger_.Info("client connected");

  protocol::FrameReader reader;
  bool ok = true;
  bool running = true;
  while (running && !connection_broken_) {
    bool readable = false;
    if (!net::WaitReadable(connection_.get(), options_.recv_timeout_s, readable, error)) {
      ok = false;
      break;
    }

    if (readable) {
      std::vector<Message> requests;
      std::string read_error;
      const protocol::ReadStatus status = reader.ReadFrom(connection_.get(), requests, read_error);
      for (const Message& request : requests) {
        if (Dispatch(request) == Flow::kStop) {
          running = false;
          break;
        }
      }
      if (running && status == protocol::ReadStatus::kClosed) {
        if (read_error.empty()) {
          logger_.Info("client closed the connection");
        } else {
          logger_.Warn("client connection ended", {{"error", read_error}});
        }
        running = false;
      } else if (running && status == protocol::ReadStatus::kError) {
        error = read_error;
        ok = false;
        running = false;
      }
    }

    if (running) {
      FlushEvents();
    }
  }

  // Sends that fail while tearing down after `eof` or a peer close are
  // expected and not reported.
  if (connection_broken_ && ok) {
    error = send_error_;
    ok = false;
  }

  CloseSession();
  connection_.Reset();
  logger_.Info("server stopped");
  return ok;
}

CameraServer::Flow CameraServer::Dispatch(const Message& request) {
  logger_.Debug("request", {{"tag", protocol::ToString(request.tag)}});

  // A session whose loop is exiting must be reaped before the next request is
  // judged against it. Its teardown is short; its remaining events, ending
  // with `cam_closed`, go out ahead of the reply to this request.
  if (controller_ != nullptr && !controller_->accepting_requests()) {
    controller_->Join();
    FlushEvents();
  }

  if (request.tag == Tag::kEof) {
    return Flow::kStop;
  }
  if (request.tag == Tag::kSerials) {
    AnswerSerials();
    return Flow::kContinue;
  }
  if (request.tag == Tag::kOpenCam) {
    OpenSession(request);
    return Flow::kContinue;
  }
  if (protocol::IsSessionScoped(request.tag)) {
    if (controller_ == nullptr) {
      RejectRequest("No camera has been opened",
                    std::string("request=") + protocol::ToString(request.tag));
      return Flow::kContinue;
    }
    controller_->SendRequest(request);
    if (request.tag == Tag::kCloseCam) {
      // Nothing queued after `close_cam` would be processed; finish the close
      // so later requests are judged without the session.
      controller_->Join();
      FlushEvents();
    }
    return Flow::kContinue;
  }

  RejectRequest(std::string("Unexpected message '") + protocol::ToString(request.tag) +
                    "' from client",
                "server accepts only client requests");
  return Flow::kContinue;
}

void CameraServer::OpenSession(const Message& request) {
  if (controller_ != nullptr) {
    RejectRequest("Camera has already been opened", "serial=" + controller_->serial());
    return;
  }

  std::string serial;
  std::string error;
  if (!protocol::ParseOpenCam(request, serial, error)) {
    RejectRequest(error, "request=open_cam");
    return;
  }

  std::unique_ptr<driver::ICameraDriver> driver;
  if (!driver::CreateCameraDriver(options_.driver_spec, driver, error)) {
    RejectRequest(driver::FormatDriverError("open", error), "serial=" + serial);
    return;
  }

  logger_.Info("opening camera", {{"serial", serial}});
  controller_ = std::make_unique<camera::CameraController>(std::move(driver), serial,
                                                           options_.controller, logger_);
  controller_->Start();
}

void CameraServer::AnswerSerials() {
  std::vector<std::string> serials;
  std::string error;
  if (discovery_driver_ == nullptr) {
    RejectRequest("camera discovery is unavailable", "driver was not prepared");
    return;
  }
  if (!discovery_driver_->DiscoverSerials(serials, error)) {
    RejectRequest(driver::FormatDriverError("discover", error), "request=serials");
    return;
  }
  Send(protocol::MakeSerials(serials));
}

void CameraServer::RejectRequest(const std::string& message, const std::string& trace) {
  logger_.Warn("request rejected", {{"reason", message}});
  Send(protocol::MakeException(message, trace));
}

void CameraServer::FlushEvents() {
  if (controller_ == nullptr) {
    return;
  }
  while (std::optional<Message> event = controller_->TryGetEvent()) {
    const bool closed = event->tag == Tag::kCamClosed;
    Send(*event);
    if (closed) {
      controller_->Join();
      controller_.reset();
      logger_.Info("camera session closed");
      return;
    }
  }
}

void CameraServer::CloseSession() {
  if (controller_ == nullptr) {
    return;
  }
  controller_->SendRequest(protocol::MakeMessage(Tag::kCloseCam));
  while (controller_ != nullptr) {
    std::optional<Message> event = controller_->GetEventFor(kCloseDrainWait);
    if (!event.has_value()) {
      continue;
    }
    const bool closed = event->tag == Tag::kCamClosed;
    Send(*event);
    if (closed) {
      controller_->Join();
      controller_.reset();
    }
  }
}

void CameraServer::Send(const Message& message) {
  if (connection_broken_ || !connection_.valid()) {
    return;
  }
  std::string error;
  if (!protocol::WriteMessage(connection_.get(), message, error)) {
    connection_broken_ = true;
    send_error_ = error;
    logger_.Error("send failed; dropping connection",
                  {{"tag", protocol::ToString(message.tag)}, {"error", error}});
  }
}

} // namespace camhost::worker
