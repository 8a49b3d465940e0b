#include "core/orchestrator.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/check_sequencer.hpp"
#include "core/escalation.hpp"
#include "core/load_pool.hpp"
#include "core/score.hpp"
#include "core/timestamp.hpp"

namespace load_bench::core {
namespace {

std::string join_hosts(const std::vector<std::string>& hosts) {
  std::string joined;
  for (const auto& host : hosts) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += host;
  }
  return joined;
}

std::uint32_t resolve_seed(const std::optional<std::uint32_t>& configured) {
  if (configured.has_value()) {
    return *configured;
  }
  return std::random_device{}();
}

// Cancels the run and joins the escalation thread on every exit path.
class EscalationThread {
 public:
  EscalationThread(EscalationController& controller, RunContext& context, model::SharedState& state)
      : context_(context), thread_([&controller, &context, &state] { controller.run(context, state); }) {}

  ~EscalationThread() { stop(); }

  EscalationThread(const EscalationThread&) = delete;
  EscalationThread& operator=(const EscalationThread&) = delete;

  void stop() {
    context_.cancel();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

 private:
  RunContext& context_;
  std::thread thread_;
};

}  // namespace

Orchestrator::Orchestrator(BenchConfig config, FunctionRegistry registry, Initializer initializer)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      initializer_(std::move(initializer)),
      seed_(resolve_seed(config_.seed)),
      counters_(std::make_shared<Counter>()),
      errors_(std::make_shared<ErrorLog>()) {}

void Orchestrator::request_stop() {
  std::lock_guard<std::mutex> lock(active_mutex_);
  stop_requested_ = true;
  if (active_context_ != nullptr) {
    active_context_->cancel();
  }
}

CounterSnapshot Orchestrator::counter_snapshot() const { return counters_->snapshot(); }

model::BenchResult Orchestrator::fail(model::BenchResult result, const std::string& message) const {
  std::cerr << "[bench] " << message << '\n';
  result.score = 0;
  result.pass = false;
  result.errors = errors_->snapshot();
  result.message = message;
  result.end_time = WallClock::now();
  return result;
}

model::BenchResult Orchestrator::run(model::SharedState& state) {
  model::BenchResult result{};
  result.start_time = WallClock::now();
  result.job_id = config_.job_id;
  result.target_hosts = join_hosts(config_.target.hosts);

  auto signals = std::make_shared<SignalBoard>();
  counters_ = std::make_shared<Counter>();
  errors_ = std::make_shared<ErrorLog>();
  std::mt19937 seeds(seed_);

  std::cerr << "[bench] state init\n";
  state.init();

  if (initializer_) {
    std::cerr << "[bench] initialize request\n";
    auto error = initializer_(state);
    if (error.has_value()) {
      errors_->append(error->message);
      return fail(std::move(result), "initialize request failed: " + error->message);
    }
  }

  RunContext context(config_.duration, signals, counters_, errors_);
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_context_ = &context;
    if (stop_requested_) {
      context.cancel();
    }
  }
  struct ActiveContextReset {
    Orchestrator& owner;
    ~ActiveContextReset() {
      std::lock_guard<std::mutex> lock(owner.active_mutex_);
      owner.active_context_ = nullptr;
    }
  } active_reset{*this};

  CheckSequencer sequencer(registry_, static_cast<std::uint32_t>(seeds()), config_.validation_penalty);

  std::cerr << "[bench] pre-test\n";
  if (auto error = sequencer.pre_test(context, state); error.has_value()) {
    return fail(std::move(result), "validation before load failed: " + error->message);
  }
  std::cerr << "[bench] pre-test done\n";

  if (config_.pre_test_only) {
    result.errors = errors_->snapshot();
    result.message = "pre-test passed.";
    result.end_time = WallClock::now();
    return result;
  }

  LoadPool pool(registry_, static_cast<std::uint32_t>(seeds()));
  EscalationController controller(EscalationOptions{.disabled = config_.no_level_up,
                                                    .tick_interval = config_.tick_interval,
                                                    .signal_window = config_.signal_window,
                                                    .level_up_burst = config_.level_up_burst},
                                  pool);

  try {
    pool.start(context, state, config_.baseline_workers);
  } catch (const std::logic_error& ex) {
    signals->guard(true);
    return fail(std::move(result), std::string("load could not start: ") + ex.what());
  }
  pool.level_up(context, state, config_.baseline_level_up);

  model::OpResult fatal_error;
  {
    EscalationThread escalation(controller, context, state);
    std::cerr << "[bench] validation main\n";
    fatal_error = sequencer.run_continuous(context, state);
    escalation.stop();
  }
  pool.drain();
  std::cerr << "[bench] validation main done, " << sequencer.stats().passes << " passes, "
            << pool.load_invocations() << " load calls\n";

  result.load_level = controller.level();
  result.logs = controller.logs();

  if (fatal_error.has_value()) {
    return fail(std::move(result), "validation during load failed: " + fatal_error->message);
  }

  bool interrupted = false;
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    interrupted = stop_requested_;
  }
  if (interrupted) {
    return fail(std::move(result), "benchmark interrupted");
  }

  const auto inputs = collect_score_inputs(*counters_);
  const auto score = compute_score(inputs);
  std::cerr << "[bench] get " << inputs.get_count << '\n'
            << "[bench] fetch " << inputs.fetch_count << '\n'
            << "[bench] post " << inputs.post_count << '\n'
            << "[bench] msg " << inputs.message_count << '\n'
            << "[bench] s304 " << inputs.not_modified_count << '\n'
            << "[bench] score " << score << '\n';

  result.pass = true;
  result.score = score;
  result.errors = errors_->snapshot();
  result.message = "ok";
  result.end_time = WallClock::now();
  return result;
}

}  // namespace load_bench::core
