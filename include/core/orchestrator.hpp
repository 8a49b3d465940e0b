#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>

#include "core/config.hpp"
#include "core/counter.hpp"
#include "core/function_registry.hpp"
#include "core/run_context.hpp"
#include "model/bench_error.hpp"
#include "model/bench_result.hpp"
#include "model/shared_state.hpp"

namespace load_bench::core {

// One-time call to the target made before the gate, e.g. resetting its dataset.
using Initializer = std::function<model::OpResult(model::SharedState&)>;

class Orchestrator {
 public:
  Orchestrator(BenchConfig config, FunctionRegistry registry, Initializer initializer = {});

  model::BenchResult run(model::SharedState& state);

  // Safe to call from any thread; cancels the run in progress, if any.
  void request_stop();

  // Counters of the last run; valid after run() returns.
  [[nodiscard]] CounterSnapshot counter_snapshot() const;

 private:
  model::BenchResult fail(model::BenchResult result, const std::string& message) const;

  BenchConfig config_;
  FunctionRegistry registry_;
  Initializer initializer_;
  std::uint32_t seed_;

  std::shared_ptr<Counter> counters_{};
  std::shared_ptr<ErrorLog> errors_{};

  mutable std::mutex active_mutex_;
  RunContext* active_context_{nullptr};
  bool stop_requested_{false};
};

}  // namespace load_bench::core
