#ifndef SERVER_HANDLER_HPP
#define SERVER_HANDLER_HPP

#include <string>

#include "executor/admission.hpp"
#include "executor/coordinator.hpp"
#include "server/http.hpp"

namespace server {

// Routes HTTP requests to the coordinator. Requests whose body is not a JSON
// object with a string "code" field are rejected here and never reach it.
// Every response allows any origin.
class Handler {
 public:
  static const constexpr char* kExecutePath = "/execute/python";

  // admission may be null, in which case submissions are not limited.
  Handler(const executor::Coordinator* coordinator,
          executor::Admission* admission)
      : coordinator_(coordinator), admission_(admission) {}

  HttpResponse Handle(const HttpRequest& request) const;

  // Builds a JSON {"error": message} response.
  static HttpResponse Error(int status, const std::string& message);

  // Adds the headers that let any origin read the response.
  static void AllowAnyOrigin(HttpResponse* response);

 private:
  HttpResponse Execute(const HttpRequest& request) const;
  static HttpResponse Preflight(const HttpRequest& request);

  const executor::Coordinator* coordinator_;
  executor::Admission* admission_;
};

}  // namespace server

#endif
