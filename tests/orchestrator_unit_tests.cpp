#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/counter.hpp"
#include "core/function_registry.hpp"
#include "core/orchestrator.hpp"
#include "core/run_context.hpp"
#include "core/score.hpp"
#include "model/bench_error.hpp"
#include "model/bench_result.hpp"
#include "model/shared_state.hpp"

using load_bench::core::BenchConfig;
using load_bench::core::BenchOperation;
using load_bench::core::FunctionRegistry;
using load_bench::core::Orchestrator;
using load_bench::core::RunContext;
using load_bench::core::collect_score_inputs;
using load_bench::core::compute_score;
using load_bench::model::BenchError;
using load_bench::model::BenchResult;
using load_bench::model::OpResult;
using load_bench::model::SharedState;

namespace {

constexpr const char* kLoadCallsKey = "load-calls";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class CountingState final : public SharedState {
 public:
  void init() override { ++init_calls; }

  std::atomic<int> init_calls{0};
};

BenchConfig short_run_config(const std::chrono::milliseconds duration = std::chrono::milliseconds(800)) {
  BenchConfig config{};
  config.duration = duration;
  config.baseline_workers = 3;
  config.tick_interval = std::chrono::milliseconds(100);
  config.signal_window = std::chrono::milliseconds(500);
  config.validation_penalty = std::chrono::milliseconds(10);
  config.seed = 42;
  config.job_id = "job-1";
  config.target.hosts = {"app1:80", "app2:80"};
  return config;
}

BenchOperation passing_check() {
  return [](RunContext&, SharedState&) -> OpResult {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return std::nullopt;
  };
}

BenchOperation counting_load() {
  return [](RunContext& context, SharedState&) -> OpResult {
    context.counters().increment(kLoadCallsKey);
    context.counters().increment("GET|/");
    context.counters().increment("POST|/api/actions/reserve");
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return std::nullopt;
  };
}

FunctionRegistry standard_registry() {
  FunctionRegistry registry;
  registry.register_check("CheckTopPage", passing_check());
  registry.register_check("CheckLogin", passing_check());
  registry.register_load(2, "LoadTopPage", counting_load());
  registry.register_level_up_load(1, "LoadEventPage", counting_load());
  return registry;
}

bool has_prefix(const std::string& value, const std::string& prefix) { return value.rfind(prefix, 0) == 0; }

int test_initialize_failure_aborts_before_gate() {
  auto check_calls = std::make_shared<std::atomic<int>>(0);
  FunctionRegistry registry = standard_registry();
  registry.register_check("CheckCounted", [check_calls](RunContext&, SharedState&) -> OpResult {
    ++*check_calls;
    return std::nullopt;
  });

  Orchestrator orchestrator(short_run_config(), registry, [](SharedState&) -> OpResult {
    return BenchError::failure("connection refused");
  });
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (result.pass || result.score != 0 || !has_prefix(result.message, "initialize request failed: ")) {
    return fail("test_initialize_failure_aborts_before_gate", "initialize failure should fail the run");
  }
  if (check_calls->load() != 0 || orchestrator.counter_snapshot().count(kLoadCallsKey) != 0) {
    return fail("test_initialize_failure_aborts_before_gate", "no check or load may run after init failure");
  }
  if (state.init_calls.load() != 1 || result.errors.size() != 1) {
    return fail("test_initialize_failure_aborts_before_gate", "state init or error collection mismatch");
  }
  return 0;
}

int test_gate_failure_starts_no_load() {
  FunctionRegistry registry = standard_registry();
  registry.register_check("CheckAdminLogin", [](RunContext&, SharedState&) -> OpResult {
    return BenchError::failure("admin login returned 500");
  });

  Orchestrator orchestrator(short_run_config(), registry);
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (result.pass || result.score != 0) {
    return fail("test_gate_failure_starts_no_load", "gate failure must force score 0 and pass false");
  }
  if (result.message != "validation before load failed: admin login returned 500") {
    return fail("test_gate_failure_starts_no_load", "message should cite the gate failure");
  }
  const auto snapshot = orchestrator.counter_snapshot();
  if (snapshot.count(kLoadCallsKey) != 0 || snapshot.count("load-level-up") != 0) {
    return fail("test_gate_failure_starts_no_load", "no load function may be invoked");
  }
  if (result.errors.size() != 1 || result.end_time < result.start_time) {
    return fail("test_gate_failure_starts_no_load", "result bookkeeping mismatch");
  }
  return 0;
}

int test_pre_test_only_stops_after_gate() {
  BenchConfig config = short_run_config();
  config.pre_test_only = true;

  Orchestrator orchestrator(config, standard_registry());
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (result.pass || result.score != 0 || result.message != "pre-test passed.") {
    return fail("test_pre_test_only_stops_after_gate", "pre-test only run should report the gate result");
  }
  if (orchestrator.counter_snapshot().count(kLoadCallsKey) != 0) {
    return fail("test_pre_test_only_stops_after_gate", "pre-test only must not start load");
  }
  return 0;
}

int test_fatal_validation_error_fails_run() {
  auto calls = std::make_shared<std::atomic<int>>(0);
  FunctionRegistry registry = standard_registry();
  registry.register_check("CheckReservationConsistency", [calls](RunContext&, SharedState&) -> OpResult {
    // The gate call passes; continuous validation finds the inconsistency.
    if (++*calls >= 3) {
      return BenchError::fatal_error("reservation count mismatch");
    }
    return std::nullopt;
  });

  Orchestrator orchestrator(short_run_config(std::chrono::seconds(20)), registry);
  CountingState state;
  const auto started = std::chrono::steady_clock::now();
  const BenchResult result = orchestrator.run(state);

  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(10)) {
    return fail("test_fatal_validation_error_fails_run", "fatal error should end the run early");
  }
  if (result.pass || result.score != 0) {
    return fail("test_fatal_validation_error_fails_run", "fatal error must force score 0 and pass false");
  }
  if (result.message != "validation during load failed: reservation count mismatch") {
    return fail("test_fatal_validation_error_fails_run", "message should cite the fatal error");
  }
  if (orchestrator.counter_snapshot().count(kLoadCallsKey) == 0) {
    return fail("test_fatal_validation_error_fails_run", "load should have been running");
  }
  return 0;
}

int test_clean_run_passes_and_scores_counters() {
  Orchestrator orchestrator(short_run_config(), standard_registry());
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (!result.pass || result.message != "ok" || !result.errors.empty()) {
    return fail("test_clean_run_passes_and_scores_counters", "clean run should pass");
  }

  load_bench::core::Counter counter;
  for (const auto& [key, count] : orchestrator.counter_snapshot()) {
    counter.add(key, count);
  }
  const auto expected = compute_score(collect_score_inputs(counter));
  if (result.score != expected || result.score <= 0) {
    return fail("test_clean_run_passes_and_scores_counters", "score should follow the counters");
  }

  if (result.load_level < 1 || result.load_level != counter.get(load_bench::core::kLoadLevelUpKey)) {
    return fail("test_clean_run_passes_and_scores_counters", "clean run should escalate");
  }
  if (result.logs.empty() || result.job_id != "job-1" || result.target_hosts != "app1:80,app2:80") {
    return fail("test_clean_run_passes_and_scores_counters", "result metadata mismatch");
  }
  return 0;
}

int test_slow_responses_hold_back_escalation() {
  FunctionRegistry registry;
  registry.register_check("CheckTopPage", passing_check());
  registry.register_load(1, "LoadSlowPage", [](RunContext& context, SharedState&) -> OpResult {
    context.signals().report_slow_path("/api/events/1");
    context.counters().increment("GET|/api/events/1");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return std::nullopt;
  });

  Orchestrator orchestrator(short_run_config(std::chrono::milliseconds(600)), registry);
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (!result.pass || result.load_level != 0) {
    return fail("test_slow_responses_hold_back_escalation", "slow responses should block every level up");
  }
  if (result.logs.empty() || result.logs.front().find("/api/events/1") == std::string::npos) {
    return fail("test_slow_responses_hold_back_escalation", "blocked tick should cite the slow path");
  }
  return 0;
}

int test_no_level_up_keeps_baseline() {
  BenchConfig config = short_run_config(std::chrono::milliseconds(500));
  config.no_level_up = true;

  Orchestrator orchestrator(config, standard_registry());
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (!result.pass || result.load_level != 0 || !result.logs.empty()) {
    return fail("test_no_level_up_keeps_baseline", "disabled escalation should never level up");
  }
  return 0;
}

int test_empty_load_registry_fails_run() {
  FunctionRegistry registry;
  registry.register_check("CheckTopPage", passing_check());

  Orchestrator orchestrator(short_run_config(), registry);
  CountingState state;
  const BenchResult result = orchestrator.run(state);

  if (result.pass || result.score != 0 || !has_prefix(result.message, "load could not start: ")) {
    return fail("test_empty_load_registry_fails_run", "empty load registry should fail fast");
  }
  return 0;
}

int test_request_stop_interrupts_run() {
  Orchestrator orchestrator(short_run_config(std::chrono::seconds(30)), standard_registry());
  CountingState state;

  std::thread stopper([&orchestrator] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    orchestrator.request_stop();
  });
  const auto started = std::chrono::steady_clock::now();
  const BenchResult result = orchestrator.run(state);
  stopper.join();

  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(10)) {
    return fail("test_request_stop_interrupts_run", "stop request should end the run promptly");
  }
  if (result.pass || result.score != 0 || result.message != "benchmark interrupted") {
    return fail("test_request_stop_interrupts_run", "interrupted run should not pass");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_initialize_failure_aborts_before_gate(); rc != 0) return rc;
  if (int rc = test_gate_failure_starts_no_load(); rc != 0) return rc;
  if (int rc = test_pre_test_only_stops_after_gate(); rc != 0) return rc;
  if (int rc = test_fatal_validation_error_fails_run(); rc != 0) return rc;
  if (int rc = test_clean_run_passes_and_scores_counters(); rc != 0) return rc;
  if (int rc = test_slow_responses_hold_back_escalation(); rc != 0) return rc;
  if (int rc = test_no_level_up_keeps_baseline(); rc != 0) return rc;
  if (int rc = test_empty_load_registry_fails_run(); rc != 0) return rc;
  if (int rc = test_request_stop_interrupts_run(); rc != 0) return rc;

  std::cout << "[PASS] orchestrator unit tests\n";
  return 0;
}
