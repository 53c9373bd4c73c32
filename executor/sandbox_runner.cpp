#include "executor/sandbox_runner.hpp"

#include <memory>

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {
const constexpr char* kBoxDir = "box";
}  // namespace

namespace executor {

SandboxRunner::SandboxRunner(const std::string& temp_directory,
                             sandbox::ResourceLimits limits)
    : temp_directory_(util::File::AbsolutePath(temp_directory)),
      limits_(limits) {}

std::string SandboxRunner::ResolveCommand(const std::string& command,
                                          std::string* error_msg) {
  if (command.empty()) {
    *error_msg = "Empty command name";
    return "";
  }
  if (command[0] == '/') return command;
  if (command.find('/') != std::string::npos) {
    *error_msg = "Relative path cannot have /: " + command;
    return "";
  }
  std::string path = util::which(command);
  if (path.empty()) {
    *error_msg = "Cannot find system program: " + command;
  }
  return path;
}

ProcessResult SandboxRunner::Run(
    const std::string& command, const std::vector<std::string>& args,
    const absl::optional<std::string>& input,
    const absl::optional<int32_t>& deadline_seconds) {
  std::string error_msg;
  std::string executable = ResolveCommand(command, &error_msg);
  if (executable.empty()) {
    LOG(WARNING) << "Cannot launch " << command << ": " << error_msg;
    return ProcessResult::LaunchFailed(error_msg);
  }

  util::TempDir tmp(temp_directory_);
  std::string sandbox_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(sandbox_dir);

  sandbox::ExecutionOptions exec_options(sandbox_dir, executable);
  exec_options.args = args;
  exec_options.limits = limits_;
  exec_options.limits.wall_millis = 0;
  if (deadline_seconds) {
    exec_options.limits.wall_millis =
        static_cast<int64_t>(*deadline_seconds) * 1000;
  }
  if (input) {
    exec_options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
    util::File::Write(exec_options.stdin_file, *input);
  }
  exec_options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  exec_options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();

  LOG(INFO) << "Executing: " << executable << " " << absl::StrJoin(args, " ")
            << (deadline_seconds
                    ? " (deadline " + std::to_string(*deadline_seconds) + "s)"
                    : "");
  sandbox::ExecutionInfo info;
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    LOG(WARNING) << "Failed to launch " << executable << ": " << error_msg;
    return ProcessResult::LaunchFailed(error_msg);
  }
  VLOG(1) << executable << " done: exit code " << info.exit_code << " signal "
          << info.signal << " wall " << info.wall_time_millis << "ms cpu "
          << info.cpu_time_millis << "ms sys " << info.sys_time_millis << "ms";

  if (info.killed) {
    LOG(WARNING) << executable << " killed after " << info.wall_time_millis
                 << "ms, deadline was " << *deadline_seconds << "s";
    return ProcessResult::TimedOut(*deadline_seconds);
  }

  int32_t code = info.signal ? -info.signal : info.exit_code;
  return ProcessResult::Exited(code, util::File::Read(exec_options.stdout_file),
                               util::File::Read(exec_options.stderr_file));
}

}  // namespace executor
