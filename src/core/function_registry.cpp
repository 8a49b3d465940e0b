#include "core/function_registry.hpp"

#include <stdexcept>
#include <utility>

namespace load_bench::core {
namespace {

void append_weighted(std::vector<BenchFunction>& target, const int weight, std::string name, BenchOperation operation) {
  if (weight < 1) {
    throw std::invalid_argument("weight of " + name + " must be at least 1");
  }
  const BenchFunction function{std::move(name), std::move(operation)};
  for (int i = 0; i < weight; ++i) {
    target.push_back(function);
  }
}

}  // namespace

void FunctionRegistry::register_check(std::string name, BenchOperation operation) {
  checks_.push_back(BenchFunction{std::move(name), std::move(operation)});
}

void FunctionRegistry::register_load(const int weight, std::string name, BenchOperation operation) {
  append_weighted(loads_, weight, std::move(name), std::move(operation));
}

void FunctionRegistry::register_level_up_load(const int weight, std::string name, BenchOperation operation) {
  append_weighted(level_up_loads_, weight, std::move(name), std::move(operation));
}

const BenchFunction& FunctionRegistry::pick_load(std::mt19937& rng) const {
  if (loads_.empty()) {
    throw std::logic_error("no load function registered");
  }
  std::uniform_int_distribution<std::size_t> dist(0, loads_.size() - 1);
  return loads_[dist(rng)];
}

}  // namespace load_bench::core
