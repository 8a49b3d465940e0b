#include "core/run_context.hpp"

#include <algorithm>
#include <utility>

namespace load_bench::core {

RunContext::RunContext(const SteadyClock::duration duration, std::shared_ptr<SignalBoard> signals,
                       std::shared_ptr<Counter> counters, std::shared_ptr<ErrorLog> errors)
    : deadline_(SteadyClock::now() + duration),
      signals_(std::move(signals)),
      counters_(std::move(counters)),
      errors_(std::move(errors)) {}

bool RunContext::cancelled() const noexcept { return cancel_requested() || deadline_exceeded(); }

bool RunContext::cancel_requested() const noexcept { return cancelled_.load(std::memory_order_acquire); }

bool RunContext::deadline_exceeded() const noexcept { return SteadyClock::now() >= deadline_; }

void RunContext::cancel() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    cancelled_.store(true, std::memory_order_release);
  }
  wait_cv_.notify_all();
}

bool RunContext::wait_for(const SteadyClock::duration duration) {
  const auto wake_at = std::min(SteadyClock::now() + duration, deadline_);
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_until(lock, wake_at, [this] { return cancelled_.load(std::memory_order_acquire); });
  return !cancelled();
}

void RunContext::report_error(const model::BenchError& error) {
  if (signals_->report_error(error)) {
    errors_->append(error.message);
  }
}

}  // namespace load_bench::core
