#include "scenario/http_client.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include "core/timestamp.hpp"

namespace load_bench::scenario {
namespace {

class Socket {
 public:
  explicit Socket(const int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  [[nodiscard]] int fd() const noexcept { return fd_; }

 private:
  int fd_;
};

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

void split_target(const std::string& target, std::string& host, std::string& port) {
  const auto split = target.rfind(':');
  if (split == std::string::npos) {
    host = target;
    port = "80";
    return;
  }
  host = target.substr(0, split);
  port = target.substr(split + 1);
  if (host.empty() || port.empty()) {
    throw std::runtime_error("invalid target address: " + target);
  }
}

std::string errno_message(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

void set_socket_timeout(const int fd, const int option, const std::chrono::milliseconds timeout) {
  const auto ms = std::max<std::int64_t>(timeout.count(), 1);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
  if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
    throw std::runtime_error(errno_message("setsockopt"));
  }
}

std::chrono::milliseconds remaining_until(const core::SteadyClock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - core::SteadyClock::now());
}

int connect_to(const std::string& target, const std::chrono::milliseconds timeout) {
  std::string host;
  std::string port;
  split_target(target, host, port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* raw = nullptr;
  const int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &raw);
  if (rc != 0) {
    throw std::runtime_error("resolve " + target + ": " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);

  std::string last_error = "no address";
  for (addrinfo* candidate = results.get(); candidate != nullptr; candidate = candidate->ai_next) {
    const int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
    if (fd < 0) {
      last_error = errno_message("socket");
      continue;
    }
    try {
      set_socket_timeout(fd, SO_RCVTIMEO, timeout);
      set_socket_timeout(fd, SO_SNDTIMEO, timeout);
    } catch (const std::runtime_error&) {
      ::close(fd);
      throw;
    }
    if (::connect(fd, candidate->ai_addr, candidate->ai_addrlen) == 0) {
      return fd;
    }
    last_error = errno_message("connect");
    ::close(fd);
  }
  throw std::runtime_error("connect " + target + ": " + last_error);
}

void send_all(const int fd, const std::string& payload) {
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const ssize_t written = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error(errno_message("send"));
    }
    sent += static_cast<std::size_t>(written);
  }
}

// Reads until the peer closes. Each recv waits at most for what is left of the deadline.
std::string receive_all(const int fd, const core::SteadyClock::time_point deadline, const std::size_t max_bytes) {
  std::string response;
  char buffer[4096];
  while (true) {
    const auto remaining = remaining_until(deadline);
    if (remaining.count() <= 0) {
      throw std::runtime_error("response timed out");
    }
    set_socket_timeout(fd, SO_RCVTIMEO, remaining);

    const ssize_t received = ::recv(fd, buffer, sizeof(buffer), 0);
    if (received == 0) {
      break;
    }
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw std::runtime_error("response timed out");
      }
      throw std::runtime_error(errno_message("recv"));
    }
    if (response.size() + static_cast<std::size_t>(received) > max_bytes) {
      throw std::runtime_error("response exceeds " + std::to_string(max_bytes) + " bytes");
    }
    response.append(buffer, static_cast<std::size_t>(received));
  }
  return response;
}

}  // namespace

int parse_status_line(const std::string& line) noexcept {
  if (line.rfind("HTTP/", 0) != 0) {
    return 0;
  }
  const auto space = line.find(' ');
  if (space == std::string::npos || space + 4 > line.size()) {
    return 0;
  }

  int status = 0;
  for (std::size_t i = space + 1; i < space + 4; ++i) {
    const char c = line[i];
    if (c < '0' || c > '9') {
      return 0;
    }
    status = status * 10 + (c - '0');
  }
  if (space + 4 < line.size() && line[space + 4] != ' ' && line[space + 4] != '\r') {
    return 0;
  }
  return status;
}

HttpResponse http_request(const HttpRequest& request) {
  const auto started = core::SteadyClock::now();
  const auto deadline = started + request.timeout;
  Socket connection(connect_to(request.target, request.timeout));

  std::string payload = "GET " + request.path + " HTTP/1.0\r\n";
  payload += "Host: " + (request.host_header.empty() ? request.target : request.host_header) + "\r\n";
  payload += "User-Agent: " + request.user_agent + "\r\n";
  payload += "Connection: close\r\n\r\n";
  send_all(connection.fd(), payload);

  const std::string raw = receive_all(connection.fd(), deadline, request.max_response_bytes);
  HttpResponse response{};
  response.status = parse_status_line(raw.substr(0, raw.find("\r\n")));
  if (response.status == 0) {
    throw std::runtime_error("malformed response from " + request.target + request.path);
  }
  response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(core::SteadyClock::now() - started);
  return response;
}

}  // namespace load_bench::scenario
