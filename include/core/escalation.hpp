#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/load_pool.hpp"
#include "core/run_context.hpp"
#include "core/timestamp.hpp"
#include "model/shared_state.hpp"

namespace load_bench::core {

enum class EscalationDecision : std::uint8_t {
  kDisabled = 0,
  kBlockedByError = 1,
  kBlockedBySlowPath = 2,
  kLevelUp = 3,
};

const char* decision_name(EscalationDecision decision) noexcept;

struct EscalationOptions {
  bool disabled{false};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds signal_window{5000};
  std::size_t level_up_burst{5};
};

class EscalationController {
 public:
  EscalationController(EscalationOptions options, LoadPool& pool);

  EscalationDecision tick(RunContext& context, model::SharedState& state, SteadyClock::time_point now);

  // Ticks until the run is cancelled, then guards the signal board.
  void run(RunContext& context, model::SharedState& state);

  [[nodiscard]] std::int64_t level() const;
  [[nodiscard]] std::vector<std::string> logs() const;

 private:
  void append_log(std::string line);

  EscalationOptions options_;
  LoadPool& pool_;

  mutable std::mutex mutex_;
  std::int64_t level_{0};
  std::vector<std::string> logs_{};
};

}  // namespace load_bench::core
