#include "core/load_pool.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace load_bench::core {

model::OpResult invoke_operation(const BenchFunction& function, RunContext& context, model::SharedState& state) {
  try {
    return function.operation(context, state);
  } catch (const std::exception& ex) {
    return model::BenchError::failure(function.name + ": " + ex.what());
  }
}

LoadPool::LoadPool(const FunctionRegistry& registry, const std::uint32_t seed) : registry_(registry), seeder_(seed) {}

LoadPool::~LoadPool() { drain(); }

void LoadPool::start(RunContext& context, model::SharedState& state, const std::size_t worker_count) {
  if (registry_.loads().empty()) {
    throw std::logic_error("cannot start load workers: no load function registered");
  }

  std::lock_guard<std::mutex> lock(threads_mutex_);
  for (std::size_t i = 0; i < worker_count; ++i) {
    const auto seed = static_cast<std::uint32_t>(seeder_());
    ++started_workers_;
    ++active_workers_;
    threads_.emplace_back([this, &context, &state, seed] { worker_loop(context, state, seed); });
  }
}

void LoadPool::level_up(RunContext& context, model::SharedState& state, const std::size_t count) {
  std::lock_guard<std::mutex> lock(threads_mutex_);
  for (std::size_t i = 0; i < count; ++i) {
    for (const auto& function : registry_.level_up_loads()) {
      ++spawned_level_up_tasks_;
      threads_.emplace_back([&function, &context, &state] {
        // One-shot burst: the error reaches the board but no worker is stopped.
        const auto error = invoke_operation(function, context, state);
        if (error.has_value()) {
          context.report_error(*error);
          std::cerr << "[load] level-up task " << function.name << " failed: " << error->message << '\n';
        }
      });
    }
  }
}

void LoadPool::drain() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    threads.swap(threads_);
  }
  for (auto& thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void LoadPool::worker_loop(RunContext& context, model::SharedState& state, const std::uint32_t seed) {
  std::mt19937 rng(seed);
  while (!context.cancelled()) {
    const auto& function = registry_.pick_load(rng);
    ++load_invocations_;
    const auto error = invoke_operation(function, context, state);
    if (error.has_value()) {
      context.report_error(*error);
      std::cerr << "[load] worker stopped after " << function.name << " failed: " << error->message << '\n';
      break;
    }
  }
  --active_workers_;
}

}  // namespace load_bench::core
