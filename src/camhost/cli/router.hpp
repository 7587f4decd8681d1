#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace camhost::cli {

// Options shared by every command that drives a worker.
struct WorkerOptions {
  std::string worker_path;
  std::string driver_spec = "sim";
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
};

struct CaptureOptions {
  WorkerOptions worker;
  std::string serial;
  std::uint64_t frames = 10;
  // Applied in order before play. Values are parsed as JSON when they parse,
  // otherwise sent as plain strings.
  std::vector<std::pair<std::string, std::string>> settings;
};

// Routes `camhost` subcommands. Exit codes:
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
//   20 => the worker could not load its driver
int Dispatch(int argc, char** argv);

} // namespace camhost::cli
