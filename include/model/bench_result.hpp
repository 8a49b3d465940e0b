#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace load_bench::model {

struct BenchResult {
  std::int64_t score{0};
  bool pass{false};
  std::int64_t load_level{0};
  std::vector<std::string> errors{};
  std::string message{};
  std::chrono::system_clock::time_point start_time{};
  std::chrono::system_clock::time_point end_time{};
  std::vector<std::string> logs{};
  std::string job_id{};
  std::string target_hosts{};
};

}  // namespace load_bench::model
