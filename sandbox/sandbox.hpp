#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Resource limits applied to the supervised process. 0 means no limit.
// Except for the wall limit they are rlimits, so they apply to each process
// the program starts, and processes counts every process of the user.
struct ResourceLimits {
  int64_t wall_millis = 0;
  int64_t address_space_kb = 0;
  int64_t file_size_kb = 0;
  int32_t processes = 0;
};

// What to run and how.
struct ExecutionOptions {
  // Absolute path of the program, and its arguments (argv[1..]).
  std::string executable;
  std::vector<std::string> args;

  // Working directory of the program. Must exist.
  std::string working_directory;

  // Files the standard streams are connected to. Without stdin_file the
  // program reads from /dev/null; without stdout_file or stderr_file the
  // stream is inherited from the caller.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;

  ResourceLimits limits;

  ExecutionOptions(std::string working_directory, std::string executable)
      : executable(std::move(executable)),
        working_directory(std::move(working_directory)) {}
};

// How the program ended, and what it used.
struct ExecutionInfo {
  int32_t exit_code = 0;
  // Number of the signal that terminated the program, 0 if it exited.
  int32_t signal = 0;
  // Set when the program was killed because of limits.wall_millis.
  bool killed = false;

  int64_t wall_time_millis = 0;
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
};

// Runs one program at a time and waits for it. The program runs in its own
// process group, which is killed when the program exits or is killed, so
// nothing it started survives it. A launch failure (the program
// never started) is reported by Execute returning false; any way the program
// ends, including being killed, is reported in ExecutionInfo.
class Sandbox {
 public:
  // Returns the sandbox for this platform.
  static std::unique_ptr<Sandbox> Create();

  // Returns false and sets error_msg if the program could not be started.
  // A single instance must not be used by more than one thread at a time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  Sandbox() = default;
  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
