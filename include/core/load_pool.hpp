#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "core/function_registry.hpp"
#include "core/run_context.hpp"
#include "model/shared_state.hpp"

namespace load_bench::core {

// Sustained workers loop over weighted random loads until cancellation or their first
// error. Level-up tasks are one-shot bursts that report errors without stopping anything. Every thread is
// tracked so drain() can join them before the shared state goes away.
class LoadPool {
 public:
  LoadPool(const FunctionRegistry& registry, std::uint32_t seed);
  ~LoadPool();

  LoadPool(const LoadPool&) = delete;
  LoadPool& operator=(const LoadPool&) = delete;

  // Throws std::logic_error when the registry holds no load function.
  void start(RunContext& context, model::SharedState& state, std::size_t worker_count);
  void level_up(RunContext& context, model::SharedState& state, std::size_t count);
  void drain();

  [[nodiscard]] std::size_t started_workers() const noexcept { return started_workers_.load(); }
  [[nodiscard]] std::size_t active_workers() const noexcept { return active_workers_.load(); }
  [[nodiscard]] std::size_t spawned_level_up_tasks() const noexcept { return spawned_level_up_tasks_.load(); }
  [[nodiscard]] std::uint64_t load_invocations() const noexcept { return load_invocations_.load(); }

 private:
  void worker_loop(RunContext& context, model::SharedState& state, std::uint32_t seed);

  const FunctionRegistry& registry_;
  std::mt19937 seeder_;

  std::mutex threads_mutex_;
  std::vector<std::thread> threads_{};

  std::atomic<std::size_t> started_workers_{0};
  std::atomic<std::size_t> active_workers_{0};
  std::atomic<std::size_t> spawned_level_up_tasks_{0};
  std::atomic<std::uint64_t> load_invocations_{0};
};

// Runs an operation and turns an escaping exception into a non-fatal error.
model::OpResult invoke_operation(const BenchFunction& function, RunContext& context, model::SharedState& state);

}  // namespace load_bench::core
