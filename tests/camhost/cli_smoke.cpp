#include "camhost/cli/router.hpp"
#include "common/assertions.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef CAMHOST_WORKER_PATH
#error "CAMHOST_WORKER_PATH must point at the camhost_worker binary"
#endif

using camhost::tests::common::AssertContains;
using camhost::tests::common::Fail;

namespace {

struct CliResult {
  int exit_code = -1;
  std::string out;
  std::string err;
};

// Redirects std::cout/std::cerr while the command runs.
class StreamCapture {
public:
  StreamCapture()
      : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}

  ~StreamCapture() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }

  StreamCapture(const StreamCapture&) = delete;
  StreamCapture& operator=(const StreamCapture&) = delete;

  std::string out() const { return out_.str(); }
  std::string err() const { return err_.str(); }

private:
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf* old_out_;
  std::streambuf* old_err_;
};

CliResult Run(std::vector<std::string> args) {
  args.insert(args.begin(), "camhost");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (std::string& arg : args) {
    argv.push_back(arg.data());
  }

  CliResult result;
  {
    StreamCapture capture;
    result.exit_code = camhost::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
    result.out = capture.out();
    result.err = capture.err();
  }
  return result;
}

std::size_t CountOccurrences(const std::string& text, const std::string& needle) {
  std::size_t count = 0;
  for (std::size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

void ExpectExit(const CliResult& result, int code, const std::string& what) {
  if (result.exit_code != code) {
    Fail(what + ": expected exit " + std::to_string(code) + ", got " +
         std::to_string(result.exit_code) + "\nstdout:\n" + result.out + "stderr:\n" +
         result.err);
  }
}

void CheckUsageErrors() {
  const CliResult version = Run({"version"});
  ExpectExit(version, 0, "version");
  AssertContains(version.out, "camhost 0.1.0");

  ExpectExit(Run({}), 2, "no command");

  const CliResult unknown = Run({"focus"});
  ExpectExit(unknown, 2, "unknown command");
  AssertContains(unknown.err, "unknown subcommand: focus");

  const CliResult no_worker = Run({"capture", "sim-00001"});
  ExpectExit(no_worker, 2, "capture without worker");
  AssertContains(no_worker.err, "--worker <path> is required");

  ExpectExit(Run({"capture", "--worker", CAMHOST_WORKER_PATH}), 2, "capture without serial");
  ExpectExit(Run({"capture", "a", "b", "--worker", CAMHOST_WORKER_PATH}), 2, "two serials");
  ExpectExit(Run({"capture", "a", "--worker", CAMHOST_WORKER_PATH, "--frames", "0"}), 2,
             "zero frames");
  ExpectExit(Run({"capture", "a", "--worker", CAMHOST_WORKER_PATH, "--set", "=1"}), 2,
             "malformed --set");
  ExpectExit(Run({"serials", "--worker", CAMHOST_WORKER_PATH, "--log-level", "loud"}), 2,
             "bad log level");
}

void CheckSerials() {
  const CliResult result =
      Run({"serials", "--worker", CAMHOST_WORKER_PATH, "--driver", "sim:serials=b-2|a-1"});
  ExpectExit(result, 0, "serials");
  if (result.out != "a-1\nb-2\n") {
    Fail("serials must print one sorted serial per line, got:\n" + result.out);
  }
}

void CheckCapture() {
  const CliResult result =
      Run({"capture", "sim-00001", "--worker", CAMHOST_WORKER_PATH, "--driver",
           "sim:width=8,height=4,fps=500", "--frames", "3", "--set", "exposure_ms=1"});
  ExpectExit(result, 0, "capture");
  if (CountOccurrences(result.out, "frame index=") != 3U) {
    Fail("capture must print exactly the requested frames, got:\n" + result.out);
  }
  AssertContains(result.out, "frame index=1 format=mono16 size=8x4");
}

void CheckCaptureFailures() {
  const CliResult missing = Run({"capture", "sim-00009", "--worker", CAMHOST_WORKER_PATH});
  ExpectExit(missing, 1, "unknown serial");
  AssertContains(missing.err, "cannot open camera 'sim-00009'");
  AssertContains(missing.err, "DEVICE_NOT_FOUND");

  const CliResult rejected = Run({"capture", "sim-00001", "--worker", CAMHOST_WORKER_PATH,
                                  "--set", "taps=8", "--frames", "1"});
  ExpectExit(rejected, 1, "rejected setting");
  AssertContains(rejected.err, "cannot start acquisition");

  const CliResult no_driver = Run({"serials", "--worker", CAMHOST_WORKER_PATH, "--driver",
                                   "/nonexistent/camhost/driver"});
  ExpectExit(no_driver, 20, "missing driver");
  AssertContains(no_driver.err, "Worker process exited with code 20");
}

} // namespace

int main() {
  CheckUsageErrors();
  CheckSerials();
  CheckCapture();
  CheckCaptureFailures();

  std::cout << "cli_smoke: ok\n";
  return 0;
}
