#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/counter.hpp"
#include "core/orchestrator.hpp"
#include "scenario/http_scenario.hpp"
#include "sinks/redis_result.hpp"
#include "sinks/result_json.hpp"
#include "sinks/stdout_summary.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const load_bench::core::BenchConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[bench] loaded config from " << config_path
         << " | duration_ms=" << config.duration.count()
         << " | pre_test_only=" << (config.pre_test_only ? "true" : "false")
         << " | no_level_up=" << (config.no_level_up ? "true" : "false")
         << " | baseline_workers=" << config.baseline_workers
         << " | checks=" << config.scenario.checks.size()
         << " | loads=" << config.scenario.loads.size()
         << " | level_up_loads=" << config.scenario.level_up_loads.size()
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | targets=";

  for (std::size_t i = 0; i < config.target.hosts.size(); ++i) {
    output << (i == 0 ? "" : ",") << config.target.hosts[i];
  }
  return output.str();
}

load_bench::sinks::RedisResultOptions redis_options(const load_bench::core::RedisConfig& redis) {
  load_bench::sinks::RedisResultOptions options{};
  options.host = redis.host;
  options.port = redis.port;
  options.unix_socket = redis.unix_socket;
  options.password = redis.password;
  options.db = redis.db;
  options.key_prefix = redis.key_prefix;
  return options;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/bench.yaml";

  load_bench::core::BenchConfig config{};
  try {
    config = load_bench::core::load_bench_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  load_bench::scenario::HttpState state(config.target.hosts);
  const auto target = config.target;
  load_bench::core::Orchestrator orchestrator(
      config, load_bench::scenario::build_http_registry(config),
      [target](load_bench::model::SharedState& shared) {
        return load_bench::scenario::request_initialize(target, dynamic_cast<load_bench::scenario::HttpState&>(shared));
      });

  // Signal handlers only set a flag; the watcher turns it into a cancellation.
  std::atomic<bool> run_finished{false};
  std::thread shutdown_watcher([&orchestrator, &run_finished] {
    while (!run_finished.load()) {
      if (g_shutdown_requested != 0) {
        std::cerr << "[bench] shutdown signal received; stopping the run\n";
        orchestrator.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  const auto result = orchestrator.run(state);
  run_finished.store(true);
  shutdown_watcher.join();

  const load_bench::sinks::StdoutSummarySink stdout_sink{};
  if (config.stdout_summary) {
    stdout_sink.publish(load_bench::core::summarize_counters(orchestrator.counter_snapshot()));
  }
  stdout_sink.publish(result);

  std::cerr << "[bench] " << load_bench::sinks::to_json(result).dump() << '\n';

  int exit_code = 0;
  if (!config.output_path.empty()) {
    try {
      load_bench::sinks::write_result_file(result, config.output_path);
      std::cerr << "[bench] result json saved to " << config.output_path << '\n';
    } catch (const std::exception& ex) {
      std::cerr << "[bench] " << ex.what() << '\n';
      exit_code = 1;
    }
  }

  if (config.redis.enabled) {
    load_bench::sinks::RedisResultSink redis_sink(redis_options(config.redis));
    if (!redis_sink.publish(result, orchestrator.counter_snapshot())) {
      std::cerr << "[redis] publish failed\n";
      exit_code = 1;
    } else {
      std::cerr << "[redis] result published to " << redis_sink.result_key(result) << '\n';
    }
  }

  return exit_code;
}
