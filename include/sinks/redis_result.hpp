#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/counter.hpp"
#include "model/bench_result.hpp"

struct redisContext;

namespace load_bench::sinks {

struct RedisResultOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"bench:run"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes a finished run as two hashes: <prefix>:<job>:result and <prefix>:<job>:counters.
class RedisResultSink {
 public:
  explicit RedisResultSink(RedisResultOptions options = {});
  ~RedisResultSink();

  RedisResultSink(const RedisResultSink&) = delete;
  RedisResultSink& operator=(const RedisResultSink&) = delete;
  RedisResultSink(RedisResultSink&&) noexcept;
  RedisResultSink& operator=(RedisResultSink&&) noexcept;

  bool publish(const model::BenchResult& result, const core::CounterSnapshot& counters);

  [[nodiscard]] std::string result_key(const model::BenchResult& result) const;
  [[nodiscard]] std::string counters_key(const model::BenchResult& result) const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool send_hash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& fields);

  RedisResultOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace load_bench::sinks
