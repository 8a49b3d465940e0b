#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace load_bench::core {

using CounterSnapshot = std::map<std::string, std::int64_t>;

// Request counters keyed by free-form strings such as "GET|/events" or "staticfile-304".
class Counter {
 public:
  void increment(const std::string& key);
  void add(const std::string& key, std::int64_t delta);

  [[nodiscard]] std::int64_t get(const std::string& key) const;
  [[nodiscard]] std::int64_t sum_prefix(const std::string& prefix) const;
  [[nodiscard]] CounterSnapshot snapshot() const;

 private:
  mutable std::mutex mutex_;
  CounterSnapshot counts_{};
};

struct CounterSummary {
  std::vector<std::pair<std::string, std::int64_t>> requests{};
  std::vector<std::pair<std::string, std::int64_t>> others{};
};

// Collapses parameterized request keys ("GET|/history/12" -> "GET|/history/*",
// "GET|/icons/a.png" -> "GET|/icons/*", "GET|/message?last=3" -> "GET|/message?*").
// Route names such as "GET|/api/events" are kept as they are.
std::string collapse_counter_key(const std::string& key);
// Orders each group by count, highest first.
CounterSummary summarize_counters(const CounterSnapshot& snapshot);

}  // namespace load_bench::core
