#ifndef EXECUTOR_COORDINATOR_HPP
#define EXECUTOR_COORDINATOR_HPP

#include <cstdint>
#include <string>

#include "executor/process_runner.hpp"
#include "executor/workspace.hpp"

namespace executor {

// Everything a client gets back for one submission. All fields are trimmed.
struct ExecutionReport {
  std::string output;
  std::string error;
  std::string lint_feedback;
};

// Runs and lints one submission at a time. Holds only static configuration,
// so a single instance can serve concurrent submissions.
class Coordinator {
 public:
  struct Options {
    // Interpreter and linter, as absolute paths or names looked up in PATH.
    std::string python = "python3";
    std::string linter = "flake8";
    // Deadlines in seconds, 0 means none.
    int32_t execution_timeout = 5;
    int32_t lint_timeout = 0;
  };

  Coordinator(Options options, ProcessRunner* runner,
              const WorkspaceManager* workspaces)
      : options_(std::move(options)),
        runner_(runner),
        workspaces_(workspaces) {}

  // Executes source_code, lints it and merges both results. Never throws:
  // every failure ends up in the error or lint_feedback text. The workspace
  // holding the source is removed before returning.
  ExecutionReport Execute(const std::string& source_code) const noexcept;

 private:
  // Runs the submission and fills output and error.
  void RunSubmission(const Workspace& workspace, ExecutionReport* report) const;

  // Lints the submission and fills lint_feedback.
  void LintSubmission(const Workspace& workspace,
                      ExecutionReport* report) const;

  Options options_;
  ProcessRunner* runner_;
  const WorkspaceManager* workspaces_;
};

}  // namespace executor

#endif
