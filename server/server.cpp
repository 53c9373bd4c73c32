#include "server/server.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <system_error>
#include <thread>

#include "absl/strings/ascii.h"
#include "glog/logging.h"

namespace {

const constexpr int kBacklog = 64;
const constexpr int kReceiveTimeoutSeconds = 30;

bool SendAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n == -1 && errno == EINTR) continue;
    if (n <= 0) return false;
    sent += n;
  }
  return true;
}

// Appends what is available on fd to data. Returns false on EOF or error.
bool ReceiveSome(int fd, std::string* data) {
  char buf[4096];
  ssize_t n = 0;
  do {
    n = recv(fd, buf, sizeof(buf), 0);
  } while (n == -1 && errno == EINTR);
  if (n <= 0) return false;
  data->append(buf, n);
  return true;
}

void Reply(int fd, server::HttpResponse response) {
  server::Handler::AllowAnyOrigin(&response);
  if (!SendAll(fd, server::SerializeResponse(response))) {
    VLOG(1) << "Client went away before the response was sent";
  }
}

}  // namespace

namespace server {

Server::~Server() {
  if (listen_fd_ != -1) close(listen_fd_);
}

void Server::Listen() {
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(port_);
  if (inet_pton(AF_INET, address_.c_str(), &address.sin_addr) != 1) {
    throw std::system_error(EINVAL, std::system_category(),
                            "Invalid address " + address_);
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ == -1) {
    throw std::system_error(errno, std::system_category(), "socket");
  }
  int opt = 1;
  if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) ==
      -1) {
    throw std::system_error(errno, std::system_category(), "setsockopt");
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&address),
           sizeof(address)) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "bind " + address_ + ":" + std::to_string(port_));
  }
  if (listen(listen_fd_, kBacklog) == -1) {
    throw std::system_error(errno, std::system_category(), "listen");
  }
  socklen_t len = sizeof(address);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&address), &len) ==
      -1) {
    throw std::system_error(errno, std::system_category(), "getsockname");
  }
  port_ = ntohs(address.sin_port);
  LOG(INFO) << "Listening on " << address_ << ":" << port_;
}

void Server::Run() {
  while (true) {
    int fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd == -1) {
      if (errno != EINTR) {
        LOG(ERROR) << "accept: " << strerror(errno);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      continue;
    }
    struct timeval timeout {};
    timeout.tv_sec = kReceiveTimeoutSeconds;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) ==
        -1) {
      LOG(WARNING) << "setsockopt SO_RCVTIMEO: " << strerror(errno);
    }
    Dispatch(fd);
  }
}

void Server::Dispatch(int fd) const {
  try {
    std::thread([this, fd]() {
      try {
        ServeConnection(fd);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Error while serving connection: " << e.what();
      }
      close(fd);
    }).detach();
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot start a thread for the connection, dropping it: "
               << e.what();
    close(fd);
  }
}

void Server::ServeConnection(int fd) const {
  std::string data;
  size_t head_end;
  while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
    if (data.size() > kMaxHeaderSize) {
      return Reply(fd, Handler::Error(431, "Request header too large"));
    }
    if (!ReceiveSome(fd, &data)) return;
  }

  HttpRequest request;
  std::string error_msg;
  if (!ParseRequestHead(data.substr(0, head_end), &request, &error_msg)) {
    VLOG(1) << "Bad request: " << error_msg;
    return Reply(fd, Handler::Error(400, error_msg));
  }
  if (!request.Header("transfer-encoding").empty()) {
    return Reply(fd, Handler::Error(501, "Transfer-Encoding not supported"));
  }
  size_t content_length = 0;
  if (!ParseContentLength(request, &content_length)) {
    return Reply(fd, Handler::Error(400, "Invalid Content-Length"));
  }
  if (content_length > kMaxBodySize) {
    return Reply(fd, Handler::Error(413, "Request body too large"));
  }

  request.body = data.substr(head_end + 4);
  if (request.body.size() < content_length &&
      absl::AsciiStrToLower(request.Header("expect")) == "100-continue") {
    if (!SendAll(fd, "HTTP/1.1 100 Continue\r\n\r\n")) return;
  }
  while (request.body.size() < content_length) {
    if (!ReceiveSome(fd, &request.body)) return;
  }
  request.body.resize(content_length);

  HttpResponse response;
  try {
    response = handler_->Handle(request);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error while handling " << request.path << ": " << e.what();
    return Reply(fd, Handler::Error(500, "Internal server error"));
  }
  if (!SendAll(fd, SerializeResponse(response))) {
    VLOG(1) << "Client went away before the response was sent";
  }
}

}  // namespace server
