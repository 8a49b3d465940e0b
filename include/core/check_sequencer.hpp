#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "core/function_registry.hpp"
#include "core/run_context.hpp"
#include "model/bench_error.hpp"
#include "model/shared_state.hpp"

namespace load_bench::core {

struct CheckSequencerStats {
  std::size_t passes{0};
  std::size_t invocations{0};
  std::size_t non_fatal_errors{0};
};

class CheckSequencer {
 public:
  CheckSequencer(const FunctionRegistry& registry, std::uint32_t seed,
                 std::chrono::milliseconds penalty = std::chrono::milliseconds(500));

  // Gate: every check once in registration order; the first error is returned.
  model::OpResult pre_test(RunContext& context, model::SharedState& state);

  // One shuffled pass. Returns only fatal errors; non-fatal ones cost the penalty sleep.
  model::OpResult validation_pass(RunContext& context, model::SharedState& state);

  // Repeats passes until the run is cancelled or a fatal error occurs.
  model::OpResult run_continuous(RunContext& context, model::SharedState& state);

  std::vector<std::size_t> next_permutation();

  [[nodiscard]] const CheckSequencerStats& stats() const noexcept { return stats_; }

 private:
  const FunctionRegistry& registry_;
  std::mt19937 rng_;
  std::chrono::milliseconds penalty_;
  CheckSequencerStats stats_{};
};

}  // namespace load_bench::core
