#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "glog/logging.h"

namespace {

const constexpr size_t kStrErrorBufSize = 256;
const constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string ErrnoMessage(const char* what, int err) {
  char buf[kStrErrorBufSize] = {};
#ifdef _GNU_SOURCE
  const char* msg = strerror_r(err, buf, sizeof(buf));
#else
  strerror_r(err, buf, sizeof(buf));
  const char* msg = buf;
#endif
  return std::string(what) + ": " + msg;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

// Async-signal-safe failure report from the child: writes "what: strerror"
// to fd, prefixed by its length, and exits.
[[noreturn]] void ChildFail(int fd, const char* what, int err) {
  char msg[PIPE_BUF - sizeof(int)] = {};
  char buf[kStrErrorBufSize] = {};
#ifdef _GNU_SOURCE
  const char* desc = strerror_r(err, buf, sizeof(buf));
#else
  strerror_r(err, buf, sizeof(buf));
  const char* desc = buf;
#endif
  strncat(msg, what, sizeof(msg) - 1);
  strncat(msg, ": ", sizeof(msg) - strlen(msg) - 1);
  strncat(msg, desc, sizeof(msg) - strlen(msg) - 1);
  int len = strlen(msg);
  if (write(fd, &len, sizeof(len)) == sizeof(len)) {
    (void)!write(fd, msg, len);
  }
  _exit(1);
}

// Returns the errno of the failed setrlimit, or 0. A limit of 0 is skipped.
int SetLimit(int resource, rlim_t value) {
  if (value == 0) return 0;
  struct rlimit rlim {};
  rlim.rlim_cur = value;
  rlim.rlim_max = value;
  return setrlimit(resource, &rlim) == -1 ? errno : 0;
}

}  // namespace

namespace sandbox {

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  if (!Prepare(error_msg)) return false;
  if (!Spawn(error_msg)) return false;
  if (!ReadLaunchError(error_msg)) return false;
  return Supervise(info, error_msg);
}

bool Unix::Prepare(std::string* error_msg) {
  if (options_->executable.empty() || options_->executable[0] != '/') {
    *error_msg = "exec: not an absolute path: " + options_->executable;
    return false;
  }
  arg_storage_.clear();
  argv_.clear();
  arg_storage_.emplace_back(options_->executable.begin(),
                            options_->executable.end());
  for (const std::string& arg : options_->args) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
  }
  for (std::vector<char>& arg : arg_storage_) {
    arg.push_back('\0');
    argv_.push_back(arg.data());
  }
  argv_.push_back(nullptr);

  if (pipe2(error_pipe_, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return true;
}

bool Unix::Spawn(std::string* error_msg) {
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    close(error_pipe_[0]);
    close(error_pipe_[1]);
    return false;
  }
  if (pid == 0) RunChild();
  child_pid_ = pid;
  close(error_pipe_[1]);
  return true;
}

void Unix::RunChild() {
  int report = error_pipe_[1];
  close(error_pipe_[0]);

  if (setsid() == -1) ChildFail(report, "setsid", errno);

  const char* stdin_path = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int in = open(stdin_path, O_RDONLY | O_CLOEXEC);
  if (in == -1) ChildFail(report, "open stdin", errno);
  int out = -1;
  if (!options_->stdout_file.empty()) {
    out = open(options_->stdout_file.c_str(),
               O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (out == -1) ChildFail(report, "open stdout", errno);
  }
  int err = -1;
  if (!options_->stderr_file.empty()) {
    err = open(options_->stderr_file.c_str(),
               O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (err == -1) ChildFail(report, "open stderr", errno);
  }

  if (chdir(options_->working_directory.c_str()) == -1) {
    ChildFail(report, "chdir", errno);
  }

  // dup2 clears FD_CLOEXEC on the new descriptor.
  if (dup2(in, STDIN_FILENO) == -1) ChildFail(report, "dup2 stdin", errno);
  if (out != -1 && dup2(out, STDOUT_FILENO) == -1) {
    ChildFail(report, "dup2 stdout", errno);
  }
  if (err != -1 && dup2(err, STDERR_FILENO) == -1) {
    ChildFail(report, "dup2 stderr", errno);
  }

  const ResourceLimits& limits = options_->limits;
  int failed = 0;
  if ((failed = SetLimit(RLIMIT_AS, limits.address_space_kb * 1024))) {
    ChildFail(report, "setrlimit AS", failed);
  }
  if ((failed = SetLimit(RLIMIT_FSIZE, limits.file_size_kb * 1024))) {
    ChildFail(report, "setrlimit FSIZE", failed);
  }
  if ((failed = SetLimit(RLIMIT_NPROC, limits.processes))) {
    ChildFail(report, "setrlimit NPROC", failed);
  }
  struct rlimit no_core {};
  if (setrlimit(RLIMIT_CORE, &no_core) == -1) {
    ChildFail(report, "setrlimit CORE", errno);
  }

  // The executable may still be open for writing by another child that has
  // not exec'd yet.
  for (int attempt = 0; attempt < 16; attempt++) {
    execv(argv_[0], argv_.data());
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  ChildFail(report, "exec", errno);
}

bool Unix::ReadLaunchError(std::string* error_msg) {
  int len = 0;
  ssize_t got = 0;
  do {
    got = read(error_pipe_[0], &len, sizeof(len));
  } while (got == -1 && errno == EINTR);

  if (got != sizeof(len)) {
    // The pipe was closed by exec: the program is running.
    close(error_pipe_[0]);
    return true;
  }
  char msg[PIPE_BUF] = {};
  if (len < 0 || len >= PIPE_BUF) len = PIPE_BUF - 1;
  ssize_t msg_len = read(error_pipe_[0], msg, len);
  close(error_pipe_[0]);
  *error_msg = msg_len > 0 ? std::string(msg, msg_len) : "exec: unknown error";

  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
  return false;
}

void Unix::KillLeftovers() {
  if (kill(-child_pid_, SIGKILL) == 0) {
    VLOG(1) << "Killed processes left behind by pid " << child_pid_;
  } else if (errno != ESRCH) {
    LOG(ERROR) << ErrnoMessage("kill process group", errno) << " (pid "
               << child_pid_ << "), some of its processes may survive";
  }
}

void Unix::KillGroup() {
  if (kill(-child_pid_, SIGKILL) == 0) return;
  LOG(ERROR) << ErrnoMessage("kill process group", errno) << " (pid "
             << child_pid_ << "), some of its processes may survive";
  if (kill(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    LOG(ERROR) << ErrnoMessage("kill", errno) << " (pid " << child_pid_ << ")";
  }
}

bool Unix::Supervise(ExecutionInfo* info, std::string* error_msg) {
  const auto start = std::chrono::steady_clock::now();
  const auto wall_limit =
      std::chrono::milliseconds(options_->limits.wall_millis);

  int status = 0;
  struct rusage usage {};
  pid_t ret = 0;
  if (wall_limit.count() > 0) {
    while (true) {
      ret = wait4(child_pid_, &status, WNOHANG, &usage);
      if (ret == -1 && errno == EINTR) continue;
      if (ret != 0) break;
      if (std::chrono::steady_clock::now() - start >= wall_limit) {
        info->killed = true;
        KillGroup();
        break;
      }
      std::this_thread::sleep_for(kPollInterval);
    }
  }
  if (ret == 0) {
    do {
      ret = wait4(child_pid_, &status, 0, &usage);
    } while (ret == -1 && errno == EINTR);
  }
  if (ret != child_pid_) {
    *error_msg = ErrnoMessage("wait4", errno);
    return false;
  }
  // Processes forked by the program do not outlive it.
  if (!info->killed) KillLeftovers();

  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  info->cpu_time_millis = ToMillis(usage.ru_utime);
  info->sys_time_millis = ToMillis(usage.ru_stime);
  if (WIFEXITED(status)) info->exit_code = WEXITSTATUS(status);
  if (WIFSIGNALED(status)) info->signal = WTERMSIG(status);
  return true;
}

}  // namespace sandbox
