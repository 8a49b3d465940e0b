#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "model/bench_error.hpp"
#include "model/shared_state.hpp"

namespace load_bench::core {

class RunContext;

using BenchOperation = std::function<model::OpResult(RunContext&, model::SharedState&)>;

struct BenchFunction {
  std::string name;
  BenchOperation operation;
};

// Checks run once in order for the gate and in shuffled passes afterwards. Loads are stored
// replicated `weight` times so a uniform pick is a weighted pick.
class FunctionRegistry {
 public:
  void register_check(std::string name, BenchOperation operation);
  void register_load(int weight, std::string name, BenchOperation operation);
  void register_level_up_load(int weight, std::string name, BenchOperation operation);

  [[nodiscard]] const std::vector<BenchFunction>& checks() const noexcept { return checks_; }
  [[nodiscard]] const std::vector<BenchFunction>& loads() const noexcept { return loads_; }
  [[nodiscard]] const std::vector<BenchFunction>& level_up_loads() const noexcept { return level_up_loads_; }

  // Throws std::logic_error when no load function is registered.
  const BenchFunction& pick_load(std::mt19937& rng) const;

 private:
  std::vector<BenchFunction> checks_{};
  std::vector<BenchFunction> loads_{};
  std::vector<BenchFunction> level_up_loads_{};
};

}  // namespace load_bench::core
