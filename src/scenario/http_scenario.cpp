#include "scenario/http_scenario.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "core/run_context.hpp"
#include "core/score.hpp"
#include "scenario/http_client.hpp"

namespace load_bench::scenario {
namespace {

enum class CheckMode { kLoad, kCheck };

bool is_success(const int status) { return (status >= 200 && status < 300) || status == 304; }

HttpRequest make_request(const core::TargetConfig& target, HttpState& state, const std::string& path,
                         const std::chrono::milliseconds timeout) {
  HttpRequest request{};
  request.target = state.next_target_host();
  request.path = path;
  request.host_header = target.host_header;
  request.timeout = timeout;
  return request;
}

core::BenchOperation make_get(core::TargetConfig target, std::string path, const CheckMode mode) {
  return [target = std::move(target), path = std::move(path), mode](core::RunContext& context,
                                                                      model::SharedState& shared) -> model::OpResult {
    auto& state = dynamic_cast<HttpState&>(shared);

    HttpResponse response{};
    try {
      response = http_request(make_request(target, state, path, target.request_timeout));
    } catch (const std::runtime_error& ex) {
      return model::BenchError::failure("GET " + path + ": " + ex.what());
    }

    if (response.elapsed > target.slow_threshold) {
      context.signals().report_slow_path(path);
    }

    if (is_success(response.status)) {
      context.counters().increment("GET|" + path);
      if (response.status == 304) {
        context.counters().increment(core::kStaticNotModifiedKey);
      }
      return std::nullopt;
    }

    const std::string message = "GET " + path + ": unexpected status code " + std::to_string(response.status);
    if (mode == CheckMode::kCheck && response.status < 500) {
      return model::BenchError::fatal_error(message);
    }
    return model::BenchError::failure(message);
  };
}

}  // namespace

HttpState::HttpState(std::vector<std::string> hosts) : hosts_(std::move(hosts)) {
  if (hosts_.empty()) {
    throw std::invalid_argument("at least one target host is required");
  }
}

void HttpState::init() { next_.store(0); }

std::string HttpState::next_target_host() { return hosts_[next_.fetch_add(1) % hosts_.size()]; }

model::OpResult request_initialize(const core::TargetConfig& target, HttpState& state) {
  HttpResponse response{};
  try {
    response = http_request(make_request(target, state, "/initialize", target.initialize_timeout));
  } catch (const std::runtime_error& ex) {
    return model::BenchError::failure(ex.what());
  }

  if (response.status < 200 || response.status >= 300) {
    return model::BenchError::failure("unexpected status code: " + std::to_string(response.status));
  }
  return std::nullopt;
}

core::FunctionRegistry build_http_registry(const core::BenchConfig& config) {
  core::FunctionRegistry registry;
  for (const auto& path : config.scenario.checks) {
    registry.register_check("Check GET " + path, make_get(config.target, path, CheckMode::kCheck));
  }
  for (const auto& load : config.scenario.loads) {
    registry.register_load(load.weight, "Load GET " + load.path, make_get(config.target, load.path, CheckMode::kLoad));
  }
  for (const auto& load : config.scenario.level_up_loads) {
    registry.register_level_up_load(load.weight, "LevelUp GET " + load.path,
                                    make_get(config.target, load.path, CheckMode::kLoad));
  }
  return registry;
}

}  // namespace load_bench::scenario
