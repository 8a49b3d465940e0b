#include "sinks/stdout_summary.hpp"

#include <cstdio>

namespace load_bench::sinks {

void StdoutSummarySink::publish(const core::CounterSummary& summary) const {
  std::printf("----- Request counts -----\n");
  for (const auto& [key, count] : summary.requests) {
    std::printf("%s %lld\n", key.c_str(), static_cast<long long>(count));
  }
  std::printf("----- Other counts ------\n");
  for (const auto& [key, count] : summary.others) {
    std::printf("%s %lld\n", key.c_str(), static_cast<long long>(count));
  }
  std::printf("-------------------------\n");
}

void StdoutSummarySink::publish(const model::BenchResult& result) const {
  std::printf("[result] pass=%s score=%lld load_level=%lld errors=%zu message=%s\n", result.pass ? "true" : "false",
              static_cast<long long>(result.score), static_cast<long long>(result.load_level), result.errors.size(),
              result.message.c_str());
}

}  // namespace load_bench::sinks
