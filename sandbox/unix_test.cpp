#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

#include <limits.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/coderunner_testdir";

// Helper programs are built in sandbox/test, relative to the directory the
// tests run in.
std::string Helper(const std::string& name) {
  char cwd[PATH_MAX] = {};
  if (!getcwd(cwd, sizeof(cwd))) return name;
  return std::string(cwd) + "/sandbox/test/" + name;
}

// True if the process exists and is not a zombie.
bool IsRunning(const std::string& pid) {
  std::string stat;
  try {
    stat = util::File::Read("/proc/" + pid + "/stat");
  } catch (const std::system_error&) {
    return false;
  }
  size_t state = stat.rfind(')');
  return state == std::string::npos || state + 2 >= stat.size() ||
         stat[state + 2] != 'Z';
}

TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", Helper("return_arg1"));
  options.args.push_back("0");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

TEST(UnixTest, TestNoFile) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("foo"));
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST(UnixTest, TestRelativeExecutable) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), "sandbox/test/return_arg1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST(UnixTest, TestReturnArg1) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("return_arg1"));
  options.args.push_back("15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.exit_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
}

TEST(UnixTest, TestSignalArg1) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("signal_arg1"));
  options.args.push_back("6");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_FALSE(info.killed);
}

TEST(UnixTest, TestWaitArg1) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("wait_arg1"));
  options.args.push_back("0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
  EXPECT_LE(info.cpu_time_millis, 50);
}

TEST(UnixTest, TestWorkingDirectory) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("pwd"));
  options.stdout_file = root.Path() + "/stdout";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_THAT(util::File::Read(options.stdout_file),
              EndsWith(util::File::BaseName(root.Path())));
}

TEST(UnixTest, TestRedirections) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("echo_streams"));
  options.args.push_back("to stderr");
  options.stdin_file = root.Path() + "/stdin";
  options.stdout_file = root.Path() + "/stdout";
  options.stderr_file = root.Path() + "/stderr";
  util::File::Write(options.stdin_file, "first\nsecond\n");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_EQ(util::File::Read(options.stdout_file), "first\nsecond\n");
  EXPECT_EQ(util::File::Read(options.stderr_file), "to stderr");
}

TEST(UnixTest, TestNoStdinReadsNothing) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("echo_streams"));
  options.stdout_file = root.Path() + "/stdout";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_EQ(util::File::Read(options.stdout_file), "");
}

TEST(UnixTest, TestWallLimitOk) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("wait_arg1"));
  options.args.push_back("0.1");
  options.limits.wall_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
}

TEST(UnixTest, TestWallLimitNotOk) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("wait_arg1"));
  options.args.push_back("10");
  options.limits.wall_millis = 100;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.killed);
  EXPECT_EQ(info.signal, 9);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_GE(info.wall_time_millis, 100);
  EXPECT_LE(info.wall_time_millis, 1000);
}

TEST(UnixTest, TestWallLimitKillsProcessGroup) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  std::string pid_file = root.Path() + "/child_pid";
  ExecutionOptions options(root.Path(), Helper("spawn_sleeper"));
  options.args.push_back(pid_file);
  options.limits.wall_millis = 300;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.killed);

  std::string child = util::File::Read(pid_file);
  // The orphaned child may linger as a zombie until something reaps it.
  bool alive = true;
  for (int i = 0; i < 100 && alive; i++) {
    alive = IsRunning(child);
    if (alive) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_FALSE(alive);
}

TEST(UnixTest, TestChildrenDieWithProgram) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  std::string pid_file = root.Path() + "/child_pid";
  ExecutionOptions options(root.Path(), Helper("spawn_sleeper"));
  options.args.push_back(pid_file);
  options.args.push_back("exit");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_FALSE(info.killed);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_EQ(info.signal, 0);

  std::string child = util::File::Read(pid_file);
  bool alive = true;
  for (int i = 0; i < 100 && alive; i++) {
    alive = IsRunning(child);
    if (alive) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_FALSE(alive);
}

TEST(UnixTest, TestFileSizeLimit) {
  util::TempDir root(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(root.Path(), Helper("echo_streams"));
  options.stdin_file = root.Path() + "/stdin";
  options.stdout_file = root.Path() + "/stdout";
  options.limits.file_size_kb = 1;
  util::File::Write(options.stdin_file, std::string(8192, 'x') + "\n");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.signal, SIGXFSZ);
  EXPECT_FALSE(info.killed);
}

}  // namespace
