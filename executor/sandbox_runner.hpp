#ifndef EXECUTOR_SANDBOX_RUNNER_HPP
#define EXECUTOR_SANDBOX_RUNNER_HPP

#include <string>
#include <vector>

#include "executor/process_runner.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// ProcessRunner that executes commands through sandbox::Sandbox. Every run
// gets its own temporary directory under temp_directory, holding the
// redirected standard streams and the working directory of the process; the
// directory is removed when the run is over. Every process runs under limits,
// whose wall limit is replaced by the deadline of each run.
class SandboxRunner : public ProcessRunner {
 public:
  explicit SandboxRunner(
      const std::string& temp_directory,
      sandbox::ResourceLimits limits = sandbox::ResourceLimits());
  ~SandboxRunner() override = default;

  ProcessResult Run(const std::string& command,
                    const std::vector<std::string>& args,
                    const absl::optional<std::string>& input,
                    const absl::optional<int32_t>& deadline_seconds) override;

 private:
  // Returns the absolute path of command, or an empty string and sets
  // error_msg if it cannot be found.
  static std::string ResolveCommand(const std::string& command,
                                    std::string* error_msg);

  std::string temp_directory_;
  sandbox::ResourceLimits limits_;
};

}  // namespace executor

#endif
