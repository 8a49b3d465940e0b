#include "core/counter.hpp"

#include <algorithm>
#include <cctype>

namespace load_bench::core {
namespace {

bool is_request_key(const std::string& key) { return key.rfind("GET|", 0) == 0 || key.rfind("POST|", 0) == 0; }

// Numeric ids and file names vary per request; route names do not.
bool is_parameter_segment(const std::string& segment) {
  const bool numeric = std::all_of(segment.begin(), segment.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
  return numeric || segment.find('.') != std::string::npos;
}

void sort_by_count(std::vector<std::pair<std::string, std::int64_t>>& entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
}

}  // namespace

void Counter::increment(const std::string& key) { add(key, 1); }

void Counter::add(const std::string& key, const std::int64_t delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  counts_[key] += delta;
}

std::int64_t Counter::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = counts_.find(key);
  return it == counts_.end() ? 0 : it->second;
}

std::int64_t Counter::sum_prefix(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::int64_t total = 0;
  for (auto it = counts_.lower_bound(prefix); it != counts_.end() && it->first.rfind(prefix, 0) == 0; ++it) {
    total += it->second;
  }
  return total;
}

CounterSnapshot Counter::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counts_;
}

std::string collapse_counter_key(const std::string& key) {
  const auto separator = key.find('|');
  if (separator == std::string::npos || separator + 1 >= key.size() || key[separator + 1] != '/') {
    return key;
  }

  const auto query = key.find('?', separator + 1);
  if (query != std::string::npos) {
    return key.substr(0, query + 1) + "*";
  }

  const auto last_slash = key.rfind('/');
  if (last_slash == separator + 1 || last_slash + 1 >= key.size()) {
    return key;
  }
  if (is_parameter_segment(key.substr(last_slash + 1))) {
    return key.substr(0, last_slash + 1) + "*";
  }
  return key;
}

CounterSummary summarize_counters(const CounterSnapshot& snapshot) {
  std::map<std::string, std::int64_t> grouped;
  for (const auto& [key, count] : snapshot) {
    grouped[collapse_counter_key(key)] += count;
  }

  CounterSummary summary{};
  for (const auto& entry : grouped) {
    if (is_request_key(entry.first)) {
      summary.requests.push_back(entry);
    } else {
      summary.others.push_back(entry);
    }
  }
  sort_by_count(summary.requests);
  sort_by_count(summary.others);
  return summary;
}

}  // namespace load_bench::core
