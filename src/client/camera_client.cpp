#include "client/camera_client.hpp"

#include "core/time_utils.hpp"
#include "net/socket.hpp"
#include "protocol/frame_io.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace camhost::client {

using protocol::Message;
using protocol::Tag;

CameraClient::CameraClient(ClientOptions options, IClientListener& listener,
                           core::logging::Logger& logger)
    : options_(std::move(options)), listener_(listener), logger_(logger) {}

CameraClient::~CameraClient() {
  if (client_thread_.joinable() || watch_thread_.joinable()) {
    StopProcess(true, kDefaultKillDelay);
  }
}

bool CameraClient::StartProcess(std::string& error) {
  if (child_.spawned()) {
    error = "worker process was already started";
    return false;
  }
  if (options_.worker_path.empty()) {
    error = "worker path is not set";
    return false;
  }

  port_ = options_.port;
  if (port_ == 0 && !net::PickOpenPort(options_.host, port_, error)) {
    error = "cannot pick a port for the worker: " + error;
    return false;
  }

  std::ostringstream timeout;
  timeout << options_.recv_timeout_s;
  const std::vector<std::string> args = {
      std::to_string(core::logging::ToNumericLevel(options_.log_level)),
      options_.driver_bin_path,
      options_.host,
      std::to_string(port_),
      timeout.str(),
  };
  if (!child_.Spawn(options_.worker_path, args, error)) {
    return false;
  }
  logger_.Info("worker spawned", {{"path", options_.worker_path},
                                  {"pid", std::to_string(child_.pid())},
                                  {"port", std::to_string(port_)}});

  watch_thread_ = std::thread([this] { WatchProcess(); });
  client_thread_ = std::thread([this] { RunClient(); });
  return true;
}

void CameraClient::SendRequest(Message request) {
  outbound_.Put(std::move(request));
}

void CameraClient::StopProcess(bool join, double kill_delay_s) {
  stopping_.store(true);
  if (client_thread_.joinable()) {
    SendRequest(protocol::MakeMessage(Tag::kEof));
  }
  if (!join) {
    return;
  }

  if (client_thread_.joinable()) {
    client_thread_.join();
  }
  if (child_.spawned()) {
    bool exited = false;
    std::string error;
    if (!child_.WaitFor(kill_delay_s, exited, error)) {
      logger_.Error("waiting for worker failed", {{"error", error}});
    }
    if (!exited) {
      logger_.Warn("worker did not exit in time; killing",
                   {{"kill_delay", core::FormatSeconds(kill_delay_s)}});
      killed_.store(true);
      if (!child_.Kill(error)) {
        logger_.Error("killing worker failed", {{"error", error}});
      }
    }
  }
  if (watch_thread_.joinable()) {
    watch_thread_.join();
  }
}

void CameraClient::WatchProcess() {
  std::string error;
  if (!child_.Wait(error)) {
    listener_.OnException("Lost track of the worker process", error);
    return;
  }

  const int code = child_.exit_code().value_or(0);
  const std::string captured = child_.stderr_text();
  logger_.Debug("worker stderr", {{"text", captured}});
  if (code != 0 && !killed_.load()) {
    logger_.Error("worker exited", {{"exit_code", std::to_string(code)}});
    listener_.OnException("Worker process exited with code " + std::to_string(code), captured);
    return;
  }
  logger_.Info("worker exited", {{"exit_code", std::to_string(code)}});
}

void CameraClient::RunClient() {
  net::SocketFd socket;
  std::string error;
  const auto keep_trying = [this] { return child_.running() && !stopping_.load(); };
  if (!net::ConnectWithRetry(options_.host, port_, options_.connect_timeout_s, keep_trying, socket,
                             error)) {
    // A worker that already died is reported by the watch thread with its
    // stderr; only report failures it cannot see.
    if (child_.running()) {
      logger_.Error("cannot connect to worker", {{"error", error}});
      listener_.OnException("Could not connect to the worker process", error);
    }
    return;
  }
  connected_.store(true);
  logger_.Info("connected to worker", {{"port", std::to_string(port_)}});

  protocol::FrameReader reader;
  bool done = false;
  while (!done) {
    bool readable = false;
    if (!net::WaitReadable(socket.get(), options_.recv_timeout_s, readable, error)) {
      listener_.OnException("Connection to the worker failed", error);
      break;
    }

    if (readable) {
      std::vector<Message> events;
      std::string read_error;
      const protocol::ReadStatus status = reader.ReadFrom(socket.get(), events, read_error);
      for (Message& event : events) {
        listener_.OnMessage(std::move(event));
      }
      if (status == protocol::ReadStatus::kClosed) {
        if (!stopping_.load()) {
          listener_.OnException("Worker closed the connection",
                                read_error.empty() ? "peer closed between frames" : read_error);
        }
        break;
      }
      if (status == protocol::ReadStatus::kError) {
        listener_.OnException("Malformed data from the worker", read_error);
        break;
      }
    }

    while (std::optional<Message> request = outbound_.TryGet()) {
      if (!protocol::WriteMessage(socket.get(), *request, error)) {
        listener_.OnException("Sending to the worker failed", error);
        done = true;
        break;
      }
      if (request->tag == Tag::kEof) {
        done = true;
        break;
      }
    }
  }

  connected_.store(false);
  logger_.Info("client thread exiting");
}

} // namespace camhost::client
