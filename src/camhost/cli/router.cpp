#include "camhost/cli/router.hpp"

#include "client/camera.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_dom.hpp"
#include "protocol/message.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string_view>

namespace camhost::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDriverUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kDriverUnavailable);

constexpr std::chrono::milliseconds kStepTimeout{10'000};
constexpr std::chrono::milliseconds kCaptureTimeout{60'000};
constexpr double kFailureKillDelay = 2.0;

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camhost serials --worker <path> [--driver <spec>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camhost capture <serial> --worker <path> [--driver <spec>] [--frames <n>] "
         "[--set <name>=<value> ...] [--log-level <debug|info|warn|error>]\n"
      << "  camhost version\n"
      << "driver spec: sim[:key=value,...] or a vendor driver directory\n";
}

// Handles the flags every worker-driving command accepts. `consumed` reports
// whether `args[i]` was one of them; `i` then points at its value.
bool ParseWorkerFlag(const std::vector<std::string_view>& args, std::size_t& i,
                     WorkerOptions& options, bool& consumed, std::string& error) {
  consumed = false;
  const std::string_view token = args[i];
  if (token != "--worker" && token != "--driver" && token != "--log-level") {
    return true;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(token);
    return false;
  }
  const std::string_view value = args[i + 1];
  if (token == "--worker") {
    options.worker_path = std::string(value);
  } else if (token == "--driver") {
    options.driver_spec = std::string(value);
  } else {
    core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(value, parsed, error)) {
      return false;
    }
    options.log_level = parsed;
  }
  ++i;
  consumed = true;
  return true;
}

bool RequireWorkerPath(const WorkerOptions& options, std::string& error) {
  if (options.worker_path.empty()) {
    error = "--worker <path> is required";
    return false;
  }
  return true;
}

bool ParseSerialsOptions(const std::vector<std::string_view>& args, WorkerOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseWorkerFlag(args, i, options, consumed, error)) {
      return false;
    }
    if (!consumed) {
      error = "unknown argument: " + std::string(args[i]);
      return false;
    }
  }
  return RequireWorkerPath(options, error);
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseWorkerFlag(args, i, options.worker, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (token == "--frames") {
      if (i + 1 >= args.size()) {
        error = "missing value for --frames";
        return false;
      }
      const std::string_view raw = args[i + 1];
      std::uint64_t frames = 0;
      const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), frames);
      if (ec != std::errc() || ptr != raw.data() + raw.size() || frames == 0) {
        error = "invalid --frames value '" + std::string(raw) + "' (expected a positive integer)";
        return false;
      }
      options.frames = frames;
      ++i;
      continue;
    }
    if (token == "--set") {
      if (i + 1 >= args.size()) {
        error = "missing value for --set";
        return false;
      }
      const std::string_view raw = args[i + 1];
      const std::size_t eq = raw.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        error = "invalid --set value '" + std::string(raw) + "' (expected <name>=<value>)";
        return false;
      }
      options.settings.emplace_back(std::string(raw.substr(0, eq)),
                                    std::string(raw.substr(eq + 1)));
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.serial.empty()) {
      error = "capture accepts exactly 1 serial";
      return false;
    }
    options.serial = std::string(token);
  }

  if (options.serial.empty()) {
    error = "capture requires a camera serial";
    return false;
  }
  return RequireWorkerPath(options.worker, error);
}

// `500` and `[1,2,3]` become JSON values; `SW Trigger` stays a string.
core::json::Value ParseSettingValue(const std::string& raw) {
  core::json::Value value;
  std::string ignored;
  if (core::json::Parse(raw, value, ignored)) {
    return value;
  }
  return core::json::MakeString(raw);
}

client::ClientOptions MakeClientOptions(const WorkerOptions& options) {
  client::ClientOptions client_options;
  client_options.worker_path = options.worker_path;
  client_options.driver_bin_path = options.driver_spec;
  client_options.log_level = options.log_level;
  return client_options;
}

// Reports the collected errors and picks the exit code. A worker that died
// because its driver could not be loaded keeps its own code.
int Fail(client::Camera& camera, std::string_view what) {
  camera.Stop(true, kFailureKillDelay);
  const client::CameraState state = camera.State();
  std::cerr << "error: " << what << '\n';
  for (const std::string& message : state.errors) {
    std::cerr << "  - " << message << '\n';
  }
  const std::optional<int> worker_code = camera.worker_exit_code();
  if (worker_code.has_value() && *worker_code == kExitDriverUnavailable) {
    return kExitDriverUnavailable;
  }
  return kExitFailure;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camhost 0.1.0\n";
  return kExitSuccess;
}

int CommandSerials(const std::vector<std::string_view>& args) {
  WorkerOptions options;
  std::string error;
  if (!ParseSerialsOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetComponent("camhost");
  client::Camera camera(MakeClientOptions(options), logger);
  if (!camera.Start(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  camera.RefreshCameras();
  const bool answered = camera.WaitForState(
      [](const client::CameraState& state) {
        return state.serials_received || !state.errors.empty();
      },
      kStepTimeout);
  const client::CameraState state = camera.State();
  if (!answered || !state.serials_received) {
    return Fail(camera, "camera discovery failed");
  }

  camera.Stop();
  for (const std::string& serial : state.serials) {
    std::cout << serial << '\n';
  }
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.worker.log_level);
  logger.SetComponent("camhost");
  client::Camera camera(MakeClientOptions(options.worker), logger);

  std::atomic<std::uint64_t> printed{0};
  const std::uint64_t wanted = options.frames;
  camera.SetImageHandler([&printed, wanted](const core::schema::FrameEnvelope& frame) {
    if (printed.fetch_add(1) >= wanted) {
      return;
    }
    std::cout << "frame index=" << frame.frame_index
              << " format=" << core::schema::ToString(frame.pixel_format)
              << " size=" << frame.width << 'x' << frame.height
              << " queued=" << frame.queued_count << " t=" << std::fixed
              << std::setprecision(6) << frame.capture_time << '\n';
  });

  if (!camera.Start(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  camera.OpenCamera(options.serial);
  const bool opened = camera.WaitForState(
      [](const client::CameraState& state) {
        return state.cam_open || state.closed_count > 0 || !state.errors.empty();
      },
      kStepTimeout);
  if (!opened || !camera.State().cam_open) {
    return Fail(camera, "cannot open camera '" + options.serial + "'");
  }

  for (const auto& [name, raw] : options.settings) {
    camera.SetSetting(name, ParseSettingValue(raw));
  }

  // Requests are answered in order, so by the time `playing` arrives every
  // setting has been echoed or rejected.
  camera.PlayCamera();
  const bool playing = camera.WaitForState(
      [](const client::CameraState& state) {
        return state.cam_playing || state.closed_count > 0 || !state.errors.empty();
      },
      kStepTimeout);
  if (!playing || !camera.State().errors.empty()) {
    return Fail(camera, "cannot start acquisition");
  }

  const bool captured = camera.WaitForState(
      [wanted](const client::CameraState& state) {
        return state.frames_received >= wanted || state.closed_count > 0 ||
               !state.errors.empty();
      },
      kCaptureTimeout);
  if (!captured || camera.State().frames_received < wanted) {
    return Fail(camera, "acquisition ended before " + std::to_string(wanted) + " frames");
  }

  camera.StopPlayingCamera();
  camera.CloseCamera();
  const bool closed = camera.WaitForState(
      [](const client::CameraState& state) { return state.closed_count > 0; }, kStepTimeout);
  if (!closed || !camera.State().errors.empty()) {
    return Fail(camera, "camera did not close cleanly");
  }

  camera.Stop();
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "serials") {
    return CommandSerials(args);
  }

  if (command == "capture") {
    return CommandCapture(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camhost::cli
