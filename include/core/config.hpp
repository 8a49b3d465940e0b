#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace load_bench::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"bench:run"};
  bool enabled{false};
};

struct TargetConfig {
  std::vector<std::string> hosts{"localhost:8080"};
  std::string host_header{};
  std::chrono::milliseconds request_timeout{10000};
  std::chrono::milliseconds initialize_timeout{10000};
  std::chrono::milliseconds slow_threshold{1000};
};

struct WeightedPath {
  std::string path;
  int weight{1};
};

struct ScenarioConfig {
  std::vector<std::string> checks{"/"};
  std::vector<WeightedPath> loads{{"/", 1}};
  std::vector<WeightedPath> level_up_loads{};
};

struct BenchConfig {
  std::chrono::milliseconds duration{std::chrono::seconds(60)};
  bool no_level_up{false};
  bool pre_test_only{false};
  std::size_t baseline_workers{10};
  std::size_t baseline_level_up{1};
  std::size_t level_up_burst{5};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds signal_window{5000};
  std::chrono::milliseconds validation_penalty{500};
  std::optional<std::uint32_t> seed{};
  std::string job_id{};
  std::string output_path{};
  bool stdout_summary{true};
  RedisConfig redis{};
  TargetConfig target{};
  ScenarioConfig scenario{};
};

BenchConfig load_bench_config(const std::string& path);

}  // namespace load_bench::core
