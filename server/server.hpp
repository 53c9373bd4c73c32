#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <cstdint>
#include <string>

#include "server/handler.hpp"

namespace server {

// Minimal HTTP/1.1 server: one request per connection, each connection served
// on its own thread.
class Server {
 public:
  Server(const Handler* handler, std::string address, int32_t port)
      : handler_(handler), address_(std::move(address)), port_(port) {}
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;
  Server(Server&&) = delete;
  Server& operator=(Server&&) = delete;

  // Binds the listening socket. Throws std::system_error on failure.
  void Listen();

  // Port the server is bound to, which differs from the requested one if
  // that was 0.
  int32_t Port() const { return port_; }

  // Accepts connections forever. Listen must have been called.
  [[noreturn]] void Run();

  // Serves fd on a new thread, which closes it when done. If no thread can be
  // started the connection is closed right away.
  void Dispatch(int fd) const;

  // Reads one request from fd, handles it and writes back the response. Does
  // not close fd.
  void ServeConnection(int fd) const;

 private:
  const Handler* handler_;
  std::string address_;
  int32_t port_;
  int listen_fd_ = -1;
};

}  // namespace server

#endif
