#ifndef SERVER_HTTP_HPP
#define SERVER_HTTP_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace server {

static const constexpr size_t kMaxHeaderSize = 64 * 1024;
static const constexpr size_t kMaxBodySize = 1024 * 1024;

struct HttpRequest {
  std::string method;
  // Request target without the query string.
  std::string path;
  std::string version;
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;

  // Returns the value of the given (lower-case) header, or an empty string.
  std::string Header(const std::string& name) const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  static HttpResponse Json(int status, std::string body);
};

// Parses the request line and headers (everything before the empty line).
// Returns false and sets error_msg if the head is malformed.
bool ParseRequestHead(const std::string& head, HttpRequest* request,
                      std::string* error_msg);

// Parses the Content-Length header of request. Returns false if it is present
// but not a valid non-negative number. A missing header means no body.
bool ParseContentLength(const HttpRequest& request, size_t* length);

// Serializes a response, adding Content-Type, Content-Length and
// Connection: close.
std::string SerializeResponse(const HttpResponse& response);

// Reason phrase for the status codes the server uses.
const char* StatusText(int status);

}  // namespace server

#endif
