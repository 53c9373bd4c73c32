#include "executor/coordinator.hpp"

#include <exception>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "executor/diagnostics.hpp"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

const constexpr char* kSourceSuffix = ".py";

std::string Trim(const std::string& s) {
  return std::string(absl::StripAsciiWhitespace(s));
}

// "--- Flake8 Error ---" for the default linter.
std::string ToolErrorHeader(const std::string& linter) {
  std::string name = util::File::BaseName(linter);
  if (!name.empty()) name[0] = absl::ascii_toupper(name[0]);
  return absl::StrCat("--- ", name, " Error ---");
}

absl::optional<int32_t> Deadline(int32_t seconds) {
  if (seconds <= 0) return absl::nullopt;
  return seconds;
}

}  // namespace

namespace executor {

ExecutionReport Coordinator::Execute(const std::string& source_code) const
    noexcept {
  ExecutionReport report;
  try {
    absl::StatusOr<Workspace> workspace =
        workspaces_->Acquire(source_code, kSourceSuffix);
    if (!workspace.ok()) {
      LOG(ERROR) << "Cannot create workspace: " << workspace.status();
      report.error = absl::StrCat("Server Error during processing: ",
                                  workspace.status().message());
    } else {
      RunSubmission(*workspace, &report);
      LintSubmission(*workspace, &report);
    }
    // The workspace is released here, or while unwinding.
  } catch (const std::exception& e) {
    LOG(ERROR) << "Submission failed: " << e.what();
    absl::StrAppend(&report.error, "\nServer Error during processing: ",
                    e.what());
  } catch (...) {
    LOG(ERROR) << "Submission failed with an unknown exception";
    absl::StrAppend(&report.error,
                    "\nServer Error during processing: unknown error");
  }

  report.output = Trim(report.output);
  report.error = Trim(report.error);
  report.lint_feedback = Trim(report.lint_feedback);
  return report;
}

void Coordinator::RunSubmission(const Workspace& workspace,
                                ExecutionReport* report) const {
  ProcessResult result =
      runner_->Run(options_.python, {workspace.Path()}, absl::nullopt,
                   Deadline(options_.execution_timeout));

  switch (result.status) {
    case ProcessResult::Status::EXITED: {
      report->output = result.stdout_text.value_or("");
      report->error = result.stderr_text.value_or("");
      if (result.exit_code != 0) {
        std::string message = absl::StrCat(
            "Process exited with status code ", result.exit_code, ".");
        // Do not repeat it if the program already said so.
        if (!absl::StrContains(report->error, message)) {
          report->error = Trim(absl::StrCat(message, " ", report->error));
        }
      }
      break;
    }
    case ProcessResult::Status::TIMED_OUT:
      report->error = Trim(absl::StrCat("Timeout Error: Execution exceeded ",
                                        result.limit_seconds, " seconds. ",
                                        result.stderr_text.value_or("")));
      break;
    case ProcessResult::Status::LAUNCH_FAILED:
      report->error = Trim(absl::StrCat(
          "Execution Error: Failed to run subprocess. ", result.reason));
      break;
  }
}

void Coordinator::LintSubmission(const Workspace& workspace,
                                 ExecutionReport* report) const {
  ProcessResult result =
      runner_->Run(options_.linter, {workspace.Path()}, absl::nullopt,
                   Deadline(options_.lint_timeout));

  // A non-zero exit code only means that issues were found.
  std::string tool_error;
  switch (result.status) {
    case ProcessResult::Status::EXITED:
      report->lint_feedback =
          JoinDiagnostics(FormatDiagnostics(result.stdout_text.value_or("")));
      tool_error = Trim(result.stderr_text.value_or(""));
      break;
    case ProcessResult::Status::TIMED_OUT:
      tool_error = absl::StrCat("Linter exceeded ", result.limit_seconds,
                                " seconds.");
      break;
    case ProcessResult::Status::LAUNCH_FAILED:
      tool_error = absl::StrCat("Failed to run linter. ", result.reason);
      break;
  }
  if (!tool_error.empty()) {
    LOG(WARNING) << "Linter failure: " << tool_error;
    absl::StrAppend(&report->lint_feedback, "\n",
                    ToolErrorHeader(options_.linter), "\n", tool_error);
  }
}

}  // namespace executor
