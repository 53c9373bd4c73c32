#ifndef EXECUTOR_PROCESS_RUNNER_HPP
#define EXECUTOR_PROCESS_RUNNER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/optional.h"

namespace executor {

// Outcome of one process run. Exactly one status applies: a non-zero exit
// code is reported as EXITED, classifying it is up to the caller.
struct ProcessResult {
  enum class Status { EXITED, TIMED_OUT, LAUNCH_FAILED };

  Status status = Status::EXITED;

  // EXITED: the exit code, or minus the signal number if the process was
  // terminated by a signal.
  int32_t exit_code = 0;

  // TIMED_OUT: the deadline that was exceeded, in seconds.
  int32_t limit_seconds = 0;

  // LAUNCH_FAILED: why the command could not be started.
  std::string reason;

  // Captured streams. Only set for EXITED.
  absl::optional<std::string> stdout_text;
  absl::optional<std::string> stderr_text;

  static ProcessResult Exited(int32_t code, std::string out, std::string err) {
    ProcessResult result;
    result.status = Status::EXITED;
    result.exit_code = code;
    result.stdout_text = std::move(out);
    result.stderr_text = std::move(err);
    return result;
  }

  static ProcessResult TimedOut(int32_t limit_seconds) {
    ProcessResult result;
    result.status = Status::TIMED_OUT;
    result.limit_seconds = limit_seconds;
    return result;
  }

  static ProcessResult LaunchFailed(std::string reason) {
    ProcessResult result;
    result.status = Status::LAUNCH_FAILED;
    result.reason = std::move(reason);
    return result;
  }
};

// Launches external commands and supervises them until they exit, time out or
// fail to start. Implementations must be safe to call from several threads at
// once: each call is independent.
class ProcessRunner {
 public:
  // Runs command with the given arguments. If input is set it is fed to the
  // standard input of the process. If deadline_seconds is set, the process
  // (and every process in its group) is killed once it has run for that long
  // and its partial output is discarded.
  virtual ProcessResult Run(const std::string& command,
                            const std::vector<std::string>& args,
                            const absl::optional<std::string>& input,
                            const absl::optional<int32_t>& deadline_seconds) = 0;

  ProcessRunner() = default;
  virtual ~ProcessRunner() = default;
  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;
  ProcessRunner(ProcessRunner&&) = delete;
  ProcessRunner& operator=(ProcessRunner&&) = delete;
};

}  // namespace executor

#endif
