#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "core/timestamp.hpp"
#include "model/bench_error.hpp"

namespace load_bench::core {

struct ErrorSignal {
  std::optional<model::BenchError> error{};
  SteadyClock::time_point observed_at{};
};

struct SlowPathSignal {
  std::optional<std::string> path{};
  SteadyClock::time_point observed_at{};
};

// Most recent error and most recent slow response of a run. Only the latest value of each
// channel is kept. Once guarded, reports are dropped so shutdown noise cannot overwrite
// the final diagnostics.
class SignalBoard {
 public:
  bool report_error(const model::BenchError& error);
  bool report_error(const model::BenchError& error, SteadyClock::time_point observed_at);
  bool report_slow_path(const std::string& path);
  bool report_slow_path(const std::string& path, SteadyClock::time_point observed_at);

  [[nodiscard]] ErrorSignal last_error() const;
  [[nodiscard]] SlowPathSignal last_slow_path() const;

  void guard(bool enable);
  [[nodiscard]] bool guarded() const;

 private:
  mutable std::mutex mutex_;
  ErrorSignal last_error_{};
  SlowPathSignal last_slow_path_{};
  bool guarded_{false};
};

}  // namespace load_bench::core
