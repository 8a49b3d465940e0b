#include "core/signal_board.hpp"

namespace load_bench::core {

bool SignalBoard::report_error(const model::BenchError& error) { return report_error(error, SteadyClock::now()); }

bool SignalBoard::report_error(const model::BenchError& error, const SteadyClock::time_point observed_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (guarded_) {
    return false;
  }
  last_error_.error = error;
  last_error_.observed_at = observed_at;
  return true;
}

bool SignalBoard::report_slow_path(const std::string& path) { return report_slow_path(path, SteadyClock::now()); }

bool SignalBoard::report_slow_path(const std::string& path, const SteadyClock::time_point observed_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (guarded_) {
    return false;
  }
  last_slow_path_.path = path;
  last_slow_path_.observed_at = observed_at;
  return true;
}

ErrorSignal SignalBoard::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

SlowPathSignal SignalBoard::last_slow_path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_slow_path_;
}

void SignalBoard::guard(const bool enable) {
  std::lock_guard<std::mutex> lock(mutex_);
  guarded_ = enable;
}

bool SignalBoard::guarded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded_;
}

}  // namespace load_bench::core
