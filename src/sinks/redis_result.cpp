#include "sinks/redis_result.hpp"

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/timestamp.hpp"

namespace load_bench::sinks {
namespace {

std::string job_segment(const model::BenchResult& result) { return result.job_id.empty() ? "latest" : result.job_id; }

std::string join_lines(const std::vector<std::string>& lines) {
  std::string joined;
  for (const auto& line : lines) {
    if (!joined.empty()) {
      joined.push_back('\n');
    }
    joined += line;
  }
  return joined;
}

std::string epoch_ms(const std::chrono::system_clock::time_point point) {
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count());
}

}  // namespace

RedisResultSink::RedisResultSink(RedisResultOptions options) : options_(std::move(options)) {}

RedisResultSink::~RedisResultSink() = default;

RedisResultSink::RedisResultSink(RedisResultSink&&) noexcept = default;
RedisResultSink& RedisResultSink::operator=(RedisResultSink&&) noexcept = default;

void RedisResultSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

std::string RedisResultSink::result_key(const model::BenchResult& result) const {
  return options_.key_prefix + ":" + job_segment(result) + ":result";
}

std::string RedisResultSink::counters_key(const model::BenchResult& result) const {
  return options_.key_prefix + ":" + job_segment(result) + ":counters";
}

bool RedisResultSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisResultSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisResultSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisResultSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisResultSink::send_hash(const std::string& key, const std::vector<std::pair<std::string, std::string>>& fields) {
  if (fields.empty()) {
    return true;
  }

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.reserve(2 + fields.size() * 2);

  command_args_.emplace_back("HSET");
  command_args_.push_back(key);
  for (const auto& [field, value] : fields) {
    command_args_.push_back(field);
    command_args_.push_back(value);
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] HSET " << key << " failed: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisResultSink::publish(const model::BenchResult& result, const core::CounterSnapshot& counters) {
  if (!ensure_connected()) {
    return false;
  }

  const std::vector<std::pair<std::string, std::string>> result_fields = {
      {"score", std::to_string(result.score)},
      {"pass", result.pass ? "true" : "false"},
      {"load_level", std::to_string(result.load_level)},
      {"message", result.message},
      {"errors", join_lines(result.errors)},
      {"logs", join_lines(result.logs)},
      {"start_time_ms", epoch_ms(result.start_time)},
      {"end_time_ms", epoch_ms(result.end_time)},
      {"target_hosts", result.target_hosts},
      {"published_at_ms", std::to_string(core::unix_timestamp_now_ms())},
  };

  std::vector<std::pair<std::string, std::string>> counter_fields;
  counter_fields.reserve(counters.size());
  for (const auto& [key, count] : counters) {
    counter_fields.emplace_back(key, std::to_string(count));
  }

  if (send_hash(result_key(result), result_fields) && send_hash(counters_key(result), counter_fields)) {
    return true;
  }

  // Retry once on a fresh connection.
  if (!reconnect()) {
    return false;
  }
  return send_hash(result_key(result), result_fields) && send_hash(counters_key(result), counter_fields);
}

}  // namespace load_bench::sinks
