#include "core/escalation.hpp"

#include <iostream>
#include <utility>

#include "core/score.hpp"

namespace load_bench::core {
namespace {

bool within_window(const SteadyClock::time_point observed_at, const SteadyClock::time_point now,
                   const std::chrono::milliseconds window) {
  return now - observed_at < window;
}

std::string log_timestamp() { return format_wall_clock(WallClock::now(), "%m/%d %H:%M:%S"); }

}  // namespace

const char* decision_name(const EscalationDecision decision) noexcept {
  switch (decision) {
    case EscalationDecision::kDisabled:
      return "disabled";
    case EscalationDecision::kBlockedByError:
      return "blocked_by_error";
    case EscalationDecision::kBlockedBySlowPath:
      return "blocked_by_slow_path";
    case EscalationDecision::kLevelUp:
      return "level_up";
  }
  return "unknown";
}

EscalationController::EscalationController(EscalationOptions options, LoadPool& pool)
    : options_(options), pool_(pool) {}

EscalationDecision EscalationController::tick(RunContext& context, model::SharedState& state,
                                              const SteadyClock::time_point now) {
  if (options_.disabled) {
    return EscalationDecision::kDisabled;
  }

  const auto error = context.signals().last_error();
  const bool has_recent_error = error.error.has_value() && within_window(error.observed_at, now, options_.signal_window);

  const auto slow = context.signals().last_slow_path();
  const bool has_recent_slow_path =
      slow.path.has_value() && !slow.path->empty() && within_window(slow.observed_at, now, options_.signal_window);

  if (has_recent_error) {
    const auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - error.observed_at).count();
    append_log(log_timestamp() + " load level held back by a recent error: " + error.error->message);
    std::cerr << "[level] " << decision_name(EscalationDecision::kBlockedByError) << ", recent error " << age_ms
              << "ms ago: " << error.error->message << '\n';
    return EscalationDecision::kBlockedByError;
  }

  if (has_recent_slow_path) {
    const auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - slow.observed_at).count();
    append_log(log_timestamp() + " load level held back by a slow response: " + *slow.path);
    std::cerr << "[level] " << decision_name(EscalationDecision::kBlockedBySlowPath) << ", slow path " << *slow.path
              << ' ' << age_ms << "ms ago\n";
    return EscalationDecision::kBlockedBySlowPath;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++level_;
  }
  append_log(log_timestamp() + " load level increased.");
  context.counters().increment(kLoadLevelUpKey);
  std::cerr << "[level] " << decision_name(EscalationDecision::kLevelUp) << " to " << level() << '\n';
  pool_.level_up(context, state, options_.level_up_burst);
  return EscalationDecision::kLevelUp;
}

void EscalationController::run(RunContext& context, model::SharedState& state) {
  while (context.wait_for(options_.tick_interval)) {
    tick(context, state, SteadyClock::now());
  }
  // The run is over; stop collecting signals and errors from here on.
  context.signals().guard(true);
}

std::int64_t EscalationController::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

std::vector<std::string> EscalationController::logs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_;
}

void EscalationController::append_log(std::string line) {
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.push_back(std::move(line));
}

}  // namespace load_bench::core
