#include "server/handler.hpp"
#include <dirent.h>
#include <memory>
#include "executor/process_runner_mock.hpp"
#include "gmock/gmock.h"
#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"
#include "proto/execution.pb.h"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::Pair;
using ::testing::Return;

using executor::ProcessResult;

const std::string test_tmpdir = "/tmp/coderunner_testdir";

size_t CountEntries(const std::string& dir) {
  size_t count = 0;
  DIR* d = opendir(dir.c_str());
  if (!d) return 0;
  while (struct dirent* entry = readdir(d)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(d);
  return count;
}

server::HttpRequest Post(const std::string& body,
                         const std::string& content_type = "application/json") {
  server::HttpRequest request;
  request.method = "POST";
  request.path = server::Handler::kExecutePath;
  request.version = "HTTP/1.1";
  if (!content_type.empty()) request.headers["content-type"] = content_type;
  request.body = body;
  return request;
}

std::string ErrorOf(const server::HttpResponse& response) {
  proto::ErrorResponse error;
  auto status =
      google::protobuf::util::JsonStringToMessage(response.body, &error);
  EXPECT_TRUE(status.ok()) << status.ToString();
  return error.error();
}

class HandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmpdir_.reset(new util::TempDir(test_tmpdir));
    workspaces_.reset(new executor::WorkspaceManager(tmpdir_->Path()));
    coordinator_.reset(new executor::Coordinator(
        executor::Coordinator::Options(), &runner_, workspaces_.get()));
    admission_.reset(new executor::Admission(2));
    handler_.reset(new server::Handler(coordinator_.get(), admission_.get()));
  }
  void TearDown() override {
    EXPECT_EQ(CountEntries(tmpdir_->Path()), 0u);
    EXPECT_EQ(admission_->Running(), 0u);
  }

  // Expects a malformed request to be rejected before reaching the runner.
  void ExpectRejected(const server::HttpRequest& request,
                      const std::string& message) {
    EXPECT_CALL(runner_, Run(_, _, _, _)).Times(0);
    server::HttpResponse response = handler_->Handle(request);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.content_type, "application/json");
    EXPECT_EQ(ErrorOf(response), message);
    EXPECT_THAT(response.headers,
                Contains(Pair("Access-Control-Allow-Origin", "*")));
  }

  std::unique_ptr<util::TempDir> tmpdir_;
  std::unique_ptr<executor::WorkspaceManager> workspaces_;
  executor::MockProcessRunner runner_;
  std::unique_ptr<executor::Coordinator> coordinator_;
  std::unique_ptr<executor::Admission> admission_;
  std::unique_ptr<server::Handler> handler_;
};

// NOLINTNEXTLINE
TEST_F(HandlerTest, Execute) {
  EXPECT_CALL(runner_, Run("python3", _, _, _))
      .WillOnce(Return(ProcessResult::Exited(0, "Hello\n", "")));
  EXPECT_CALL(runner_, Run("flake8", _, _, _))
      .WillOnce(Return(ProcessResult::Exited(1, "f.py:1:6: E999 oops\n", "")));
  server::HttpResponse response =
      handler_->Handle(Post(R"json({"code": "print('Hello')"})json"));
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.content_type, "application/json");
  EXPECT_THAT(response.headers,
              Contains(Pair("Access-Control-Allow-Origin", "*")));

  proto::ExecuteResponse result;
  ASSERT_TRUE(
      google::protobuf::util::JsonStringToMessage(response.body, &result).ok())
      << response.body;
  EXPECT_EQ(result.output(), "Hello");
  EXPECT_EQ(result.error(), "");
  EXPECT_EQ(result.lint_feedback(), "L1:6: E999 oops");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, ExecuteAlwaysHasAllFields) {
  EXPECT_CALL(runner_, Run(_, _, _, _))
      .WillRepeatedly(Return(ProcessResult::Exited(0, "", "")));
  server::HttpResponse response = handler_->Handle(Post(R"({"code": ""})"));
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.body,
            R"({"output":"","error":"","lint_feedback":""})");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, ExecutionFailureIsStill200) {
  EXPECT_CALL(runner_, Run("python3", _, _, _))
      .WillOnce(Return(ProcessResult::TimedOut(5)));
  EXPECT_CALL(runner_, Run("flake8", _, _, _))
      .WillOnce(Return(ProcessResult::Exited(0, "", "")));
  server::HttpResponse response = handler_->Handle(
      Post(R"json({"code": "import time; time.sleep(10)"})json"));
  EXPECT_EQ(response.status, 200);
  proto::ExecuteResponse result;
  ASSERT_TRUE(
      google::protobuf::util::JsonStringToMessage(response.body, &result).ok());
  EXPECT_EQ(result.error(), "Timeout Error: Execution exceeded 5 seconds.");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, JsonContentTypeVariants) {
  EXPECT_CALL(runner_, Run(_, _, _, _))
      .WillRepeatedly(Return(ProcessResult::Exited(0, "", "")));
  EXPECT_EQ(handler_
                ->Handle(Post(R"({"code": "x"})",
                              "Application/JSON; charset=utf-8"))
                .status,
            200);
  EXPECT_EQ(
      handler_->Handle(Post(R"({"code": "x"})", "application/vnd.api+json"))
          .status,
      200);
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, RejectsNonJsonContentType) {
  ExpectRejected(Post(R"({"code": "x"})", "text/plain"),
                 "Request must be JSON");
  ExpectRejected(Post(R"({"code": "x"})", ""), "Request must be JSON");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, RejectsInvalidJson) {
  ExpectRejected(Post(""), "Request must be JSON");
  ExpectRejected(Post("{\"code\": "), "Request must be JSON");
  ExpectRejected(Post("[1, 2]"), "Request must be JSON");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, RejectsMissingCode) {
  ExpectRejected(Post("{}"), "Missing 'code' field in JSON payload");
  ExpectRejected(Post(R"json({"source": "print(1)"})json"),
                 "Missing 'code' field in JSON payload");
  ExpectRejected(Post(R"({"code": null})"),
                 "Missing 'code' field in JSON payload");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, RejectsNonStringCode) {
  ExpectRejected(Post(R"({"code": 42})"), "Field 'code' must be a string");
  ExpectRejected(Post(R"json({"code": ["print(1)"]})json"),
                 "Field 'code' must be a string");
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, NotFound) {
  EXPECT_CALL(runner_, Run(_, _, _, _)).Times(0);
  server::HttpRequest request = Post(R"({"code": "x"})");
  request.path = "/execute/ruby";
  server::HttpResponse response = handler_->Handle(request);
  EXPECT_EQ(response.status, 404);
  EXPECT_THAT(response.headers,
              Contains(Pair("Access-Control-Allow-Origin", "*")));
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, MethodNotAllowed) {
  EXPECT_CALL(runner_, Run(_, _, _, _)).Times(0);
  server::HttpRequest request = Post("");
  request.method = "GET";
  server::HttpResponse response = handler_->Handle(request);
  EXPECT_EQ(response.status, 405);
  EXPECT_THAT(response.headers, Contains(Pair("Allow", "POST, OPTIONS")));
  EXPECT_THAT(response.headers,
              Contains(Pair("Access-Control-Allow-Origin", "*")));
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, Preflight) {
  EXPECT_CALL(runner_, Run(_, _, _, _)).Times(0);
  server::HttpRequest request = Post("");
  request.method = "OPTIONS";
  request.headers["access-control-request-headers"] = "content-type, x-token";
  server::HttpResponse response = handler_->Handle(request);
  EXPECT_EQ(response.status, 204);
  EXPECT_EQ(response.body, "");
  EXPECT_THAT(response.headers,
              Contains(Pair("Access-Control-Allow-Origin", "*")));
  EXPECT_THAT(response.headers,
              Contains(Pair("Access-Control-Allow-Methods", "POST, OPTIONS")));
  EXPECT_THAT(response.headers, Contains(Pair("Access-Control-Allow-Headers",
                                              "content-type, x-token")));
}

// NOLINTNEXTLINE
TEST_F(HandlerTest, PreflightDefaultHeaders) {
  server::HttpRequest request = Post("");
  request.method = "OPTIONS";
  server::HttpResponse response = handler_->Handle(request);
  EXPECT_THAT(response.headers, Contains(Pair("Access-Control-Allow-Headers",
                                              "Content-Type")));
}

// NOLINTNEXTLINE
TEST(Handler, Error) {
  server::HttpResponse response = server::Handler::Error(413, "too big");
  EXPECT_EQ(response.status, 413);
  EXPECT_EQ(response.body, R"({"error":"too big"})");
}

}  // namespace
