#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace load_bench::scenario {

struct HttpRequest {
  std::string target;  // host:port
  std::string path{"/"};
  std::string host_header{};
  std::string user_agent{"load-bench"};
  // Bounds the whole exchange, not each read.
  std::chrono::milliseconds timeout{10000};
  std::size_t max_response_bytes{1U << 20U};
};

struct HttpResponse {
  int status{0};
  std::chrono::milliseconds elapsed{0};
};

// Blocking HTTP/1.0 GET over a fresh TCP connection. Throws std::runtime_error on
// resolution, connection, timeout, oversized or malformed responses.
HttpResponse http_request(const HttpRequest& request);

// Extracts the status code from "HTTP/1.1 200 OK"; returns 0 when malformed.
int parse_status_line(const std::string& line) noexcept;

}  // namespace load_bench::scenario
