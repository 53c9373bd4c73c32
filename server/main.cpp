#include <system_error>

#include "executor/admission.hpp"
#include "executor/coordinator.hpp"
#include "executor/sandbox_runner.hpp"
#include "executor/workspace.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "server/handler.hpp"
#include "server/server.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (util::which(FLAGS_python).empty()) {
    LOG(WARNING) << "Cannot find " << FLAGS_python
                 << ", submissions will fail to run";
  }
  if (util::which(FLAGS_linter).empty()) {
    LOG(WARNING) << "Cannot find " << FLAGS_linter
                 << ", submissions will not be linted";
  }

  executor::WorkspaceManager workspaces(FLAGS_temp_directory);
  sandbox::ResourceLimits limits;
  limits.address_space_kb = static_cast<int64_t>(FLAGS_memory_limit_mb) * 1024;
  limits.file_size_kb = FLAGS_output_limit_kb;
  limits.processes = FLAGS_process_limit;
  executor::SandboxRunner runner(FLAGS_temp_directory, limits);
  executor::Coordinator::Options options;
  options.python = FLAGS_python;
  options.linter = FLAGS_linter;
  options.execution_timeout = FLAGS_execution_timeout;
  options.lint_timeout = FLAGS_lint_timeout;
  executor::Coordinator coordinator(options, &runner, &workspaces);
  executor::Admission admission(FLAGS_max_concurrent_submissions);
  LOG(INFO) << "Running at most " << admission.MaxRunning()
            << " submissions at the same time";

  server::Handler handler(&coordinator, &admission);
  server::Server server(&handler, FLAGS_address, FLAGS_port);
  try {
    server.Listen();
  } catch (const std::system_error& e) {
    LOG(FATAL) << "Cannot start the server: " << e.what();
  }
  server.Run();
}
