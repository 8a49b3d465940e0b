#include "core/check_sequencer.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

#include "core/load_pool.hpp"
#include "core/timestamp.hpp"

namespace load_bench::core {

CheckSequencer::CheckSequencer(const FunctionRegistry& registry, const std::uint32_t seed,
                               const std::chrono::milliseconds penalty)
    : registry_(registry), rng_(seed), penalty_(penalty) {}

model::OpResult CheckSequencer::pre_test(RunContext& context, model::SharedState& state) {
  for (const auto& check : registry_.checks()) {
    ++stats_.invocations;
    auto error = invoke_operation(check, context, state);
    if (error.has_value()) {
      context.report_error(*error);
      return error;
    }
  }
  return std::nullopt;
}

std::vector<std::size_t> CheckSequencer::next_permutation() {
  std::vector<std::size_t> order(registry_.checks().size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::shuffle(order.begin(), order.end(), rng_);
  return order;
}

model::OpResult CheckSequencer::validation_pass(RunContext& context, model::SharedState& state) {
  ++stats_.passes;
  for (const std::size_t index : next_permutation()) {
    if (context.cancelled()) {
      return std::nullopt;
    }

    const auto& check = registry_.checks()[index];
    const auto started = SteadyClock::now();
    ++stats_.invocations;
    auto error = invoke_operation(check, context, state);
    std::cerr << "[validation] " << check.name << ' ' << elapsed_ms(started) << "ms\n";

    if (!error.has_value()) {
      continue;
    }

    context.report_error(*error);
    if (error->fatal) {
      return error;
    }

    // Failing checks must not be cheaper than passing ones.
    ++stats_.non_fatal_errors;
    context.wait_for(penalty_);
  }
  return std::nullopt;
}

model::OpResult CheckSequencer::run_continuous(RunContext& context, model::SharedState& state) {
  if (registry_.checks().empty()) {
    while (context.wait_for(std::chrono::milliseconds(100))) {
    }
    return std::nullopt;
  }

  while (!context.cancelled()) {
    auto error = validation_pass(context, state);
    if (error.has_value()) {
      return error;
    }
  }
  return std::nullopt;
}

}  // namespace load_bench::core
