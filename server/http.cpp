#include "server/http.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace server {

std::string HttpRequest::Header(const std::string& name) const {
  auto it = headers.find(name);
  return it == headers.end() ? "" : it->second;
}

HttpResponse HttpResponse::Json(int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  return response;
}

bool ParseRequestHead(const std::string& head, HttpRequest* request,
                      std::string* error_msg) {
  std::vector<absl::string_view> lines = absl::StrSplit(head, "\r\n");
  if (lines.empty() || lines[0].empty()) {
    *error_msg = "Empty request line";
    return false;
  }

  std::vector<absl::string_view> request_line =
      absl::StrSplit(lines[0], ' ', absl::SkipEmpty());
  if (request_line.size() != 3) {
    *error_msg = "Malformed request line";
    return false;
  }
  if (!absl::StartsWith(request_line[2], "HTTP/")) {
    *error_msg = "Unsupported protocol";
    return false;
  }
  request->method = std::string(request_line[0]);
  absl::string_view target = request_line[1];
  request->path = std::string(target.substr(0, target.find('?')));
  request->version = std::string(request_line[2]);

  for (size_t i = 1; i < lines.size(); i++) {
    if (lines[i].empty()) continue;
    size_t colon = lines[i].find(':');
    if (colon == absl::string_view::npos || colon == 0) {
      *error_msg = "Malformed header";
      return false;
    }
    std::string name = absl::AsciiStrToLower(lines[i].substr(0, colon));
    request->headers[name] =
        std::string(absl::StripAsciiWhitespace(lines[i].substr(colon + 1)));
  }
  return true;
}

bool ParseContentLength(const HttpRequest& request, size_t* length) {
  auto it = request.headers.find("content-length");
  if (it == request.headers.end()) {
    *length = 0;
    return true;
  }
  uint64_t value = 0;
  if (!absl::SimpleAtoi(it->second, &value)) return false;
  *length = value;
  return true;
}

std::string SerializeResponse(const HttpResponse& response) {
  std::string out = absl::StrCat("HTTP/1.1 ", response.status, " ",
                                 StatusText(response.status), "\r\n");
  if (!response.body.empty() || response.status != 204) {
    absl::StrAppend(&out, "Content-Type: ", response.content_type, "\r\n");
    absl::StrAppend(&out, "Content-Length: ", response.body.size(), "\r\n");
  }
  for (const auto& header : response.headers) {
    absl::StrAppend(&out, header.first, ": ", header.second, "\r\n");
  }
  absl::StrAppend(&out, "Connection: close\r\n\r\n", response.body);
  return out;
}

const char* StatusText(int status) {
  switch (status) {
    case 100:
      return "Continue";
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    default:
      return "Unknown";
  }
}

}  // namespace server
