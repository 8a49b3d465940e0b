#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include "core/counter.hpp"
#include "core/error_log.hpp"
#include "core/signal_board.hpp"
#include "core/timestamp.hpp"
#include "model/bench_error.hpp"

namespace load_bench::core {

// Cancellation scope of one run: a wall-clock deadline plus an explicit cancel flag.
// Every loop of the run polls cancelled() at its own well-defined points.
class RunContext {
 public:
  RunContext(SteadyClock::duration duration, std::shared_ptr<SignalBoard> signals,
             std::shared_ptr<Counter> counters, std::shared_ptr<ErrorLog> errors);

  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;

  [[nodiscard]] bool cancelled() const noexcept;
  [[nodiscard]] bool cancel_requested() const noexcept;
  [[nodiscard]] bool deadline_exceeded() const noexcept;
  [[nodiscard]] SteadyClock::time_point deadline() const noexcept { return deadline_; }

  void cancel();

  // Returns false when the run was cancelled (or hit its deadline) before the wait ended.
  bool wait_for(SteadyClock::duration duration);

  // Records an error on the signal board and, when accepted, in the run's error log.
  void report_error(const model::BenchError& error);

  SignalBoard& signals() noexcept { return *signals_; }
  Counter& counters() noexcept { return *counters_; }
  ErrorLog& errors() noexcept { return *errors_; }

 private:
  SteadyClock::time_point deadline_;
  std::shared_ptr<SignalBoard> signals_;
  std::shared_ptr<Counter> counters_;
  std::shared_ptr<ErrorLog> errors_;

  std::atomic<bool> cancelled_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

}  // namespace load_bench::core
