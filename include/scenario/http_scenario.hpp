#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/function_registry.hpp"
#include "model/bench_error.hpp"
#include "model/shared_state.hpp"

namespace load_bench::scenario {

class HttpState final : public model::SharedState {
 public:
  explicit HttpState(std::vector<std::string> hosts);

  void init() override;

  // Round-robin over the configured targets.
  std::string next_target_host();

 private:
  std::vector<std::string> hosts_;
  std::atomic<std::size_t> next_{0};
};

model::OpResult request_initialize(const core::TargetConfig& target, HttpState& state);

// Checks, loads and level-up loads built from the scenario section of the config.
core::FunctionRegistry build_http_registry(const core::BenchConfig& config);

}  // namespace load_bench::scenario
