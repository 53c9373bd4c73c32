#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// fork/exec supervisor for POSIX systems. The child becomes the leader of a
// new session, so that a wall limit kill reaches every process it spawned.
class Unix : public Sandbox {
 public:
  Unix() = default;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  // Builds argv and the error pipe. Runs before fork: the child of a
  // multi-threaded process must not allocate.
  bool Prepare(std::string* error_msg);

  bool Spawn(std::string* error_msg);

  // Runs in the child. Either execs or reports why it could not through the
  // error pipe and exits.
  [[noreturn]] void RunChild();

  // Returns false if the child reported a launch failure.
  bool ReadLaunchError(std::string* error_msg);

  // Waits for the child, killing its process group once the wall limit
  // expires or once the child has exited.
  bool Supervise(ExecutionInfo* info, std::string* error_msg);

  void KillGroup();
  void KillLeftovers();

  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  int error_pipe_[2] = {-1, -1};
  pid_t child_pid_ = 0;
};

}  // namespace sandbox

#endif
