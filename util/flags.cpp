#include "util/flags.hpp"

#include <cstdlib>
#include <string>

namespace {
const char* DefaultTempDirectory() {
  const char* tmpdir = std::getenv("TMPDIR");
  return tmpdir && *tmpdir ? tmpdir : "/tmp";
}

bool ValidatePort(const char* flagname, int32_t value) {
  return value > 0 && value < 65536;
}

bool ValidateNonNegative(const char* flagname, int32_t value) {
  return value >= 0;
}

// Linter output is split on ':', so paths of submissions cannot contain one.
bool ValidateTempDirectory(const char* flagname, const std::string& value) {
  return !value.empty() && value.find(':') == std::string::npos;
}
}  // namespace

DEFINE_string(address, "0.0.0.0", "Address to listen on");
DEFINE_int32(port, 5000, "Port to listen on");
DEFINE_validator(port, &ValidatePort);
DEFINE_int32(max_concurrent_submissions, 0,
             "Maximum number of submissions executed at the same time. If "
             "unset, use the number of hardware threads");
DEFINE_validator(max_concurrent_submissions, &ValidateNonNegative);

DEFINE_int32(execution_timeout, 5,
             "Wall clock limit for the execution of a submission, in seconds");
DEFINE_validator(execution_timeout, &ValidateNonNegative);
DEFINE_int32(lint_timeout, 0,
             "Wall clock limit for the linter, in seconds. 0 means no limit");
DEFINE_validator(lint_timeout, &ValidateNonNegative);
DEFINE_string(python, "python3", "Interpreter used to run submissions");
DEFINE_string(linter, "flake8", "Linter used to check submissions");
DEFINE_string(temp_directory, DefaultTempDirectory(),
              "Where workspaces and execution directories are created");
DEFINE_validator(temp_directory, &ValidateTempDirectory);

DEFINE_int32(memory_limit_mb, 1024,
             "Address space limit of each process, in MiB. 0 means no limit");
DEFINE_validator(memory_limit_mb, &ValidateNonNegative);
DEFINE_int32(output_limit_kb, 16384,
             "Size limit of every file a process writes, including its "
             "captured output, in KiB. 0 means no limit");
DEFINE_validator(output_limit_kb, &ValidateNonNegative);
DEFINE_int32(process_limit, 512,
             "Maximum number of processes of the user the server runs as, "
             "checked when a submission forks. 0 means no limit");
DEFINE_validator(process_limit, &ValidateNonNegative);
