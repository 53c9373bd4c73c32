#include "server/handler.hpp"

#include <memory>
#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "proto/execution.pb.h"

namespace {

const constexpr char* kNotJson = "Request must be JSON";
const constexpr char* kMissingCode = "Missing 'code' field in JSON payload";

// Same rule as most web frameworks: application/json or any +json type.
bool IsJsonContentType(const std::string& content_type) {
  absl::string_view mime = content_type;
  mime = mime.substr(0, mime.find(';'));
  std::string lower = absl::AsciiStrToLower(absl::StripAsciiWhitespace(mime));
  return lower == "application/json" || absl::EndsWith(lower, "+json");
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(message, &json,
                                                            options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot serialize response: " +
                             status.ToString());
  }
  return json;
}

}  // namespace

namespace server {

HttpResponse Handler::Error(int status, const std::string& message) {
  proto::ErrorResponse error;
  error.set_error(message);
  return HttpResponse::Json(status, ToJson(error));
}

void Handler::AllowAnyOrigin(HttpResponse* response) {
  response->headers.emplace_back("Access-Control-Allow-Origin", "*");
}

HttpResponse Handler::Handle(const HttpRequest& request) const {
  HttpResponse response;
  if (request.method == "OPTIONS") {
    response = Preflight(request);
  } else if (request.path != kExecutePath) {
    response = Error(404, "Not found");
  } else if (request.method != "POST") {
    response = Error(405, "Method not allowed");
    response.headers.emplace_back("Allow", "POST, OPTIONS");
  } else {
    response = Execute(request);
  }
  AllowAnyOrigin(&response);
  LOG(INFO) << request.method << " " << request.path << " -> "
            << response.status;
  return response;
}

HttpResponse Handler::Preflight(const HttpRequest& request) {
  HttpResponse response;
  response.status = 204;
  response.headers.emplace_back("Access-Control-Allow-Methods",
                                "POST, OPTIONS");
  std::string requested = request.Header("access-control-request-headers");
  response.headers.emplace_back("Access-Control-Allow-Headers",
                                requested.empty() ? "Content-Type" : requested);
  return response;
}

HttpResponse Handler::Execute(const HttpRequest& request) const {
  if (!IsJsonContentType(request.Header("content-type"))) {
    return Error(400, kNotJson);
  }
  google::protobuf::Struct payload;
  google::protobuf::util::JsonParseOptions options;
  auto status = google::protobuf::util::JsonStringToMessage(request.body,
                                                            &payload, options);
  if (!status.ok()) {
    VLOG(1) << "Invalid JSON payload: " << status.ToString();
    return Error(400, kNotJson);
  }
  auto code = payload.fields().find("code");
  if (code == payload.fields().end() ||
      code->second.kind_case() == google::protobuf::Value::kNullValue) {
    return Error(400, kMissingCode);
  }
  if (code->second.kind_case() != google::protobuf::Value::kStringValue) {
    return Error(400, "Field 'code' must be a string");
  }

  executor::ExecutionReport report;
  {
    std::unique_ptr<executor::Admission::Slot> slot;
    if (admission_) slot.reset(new executor::Admission::Slot(admission_));
    report = coordinator_->Execute(code->second.string_value());
  }

  proto::ExecuteResponse response;
  response.set_output(report.output);
  response.set_error(report.error);
  response.set_lint_feedback(report.lint_feedback);
  return HttpResponse::Json(200, ToJson(response));
}

}  // namespace server
