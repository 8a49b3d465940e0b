#include "sinks/result_json.hpp"

#include <fstream>
#include <stdexcept>

#include "core/timestamp.hpp"

namespace load_bench::sinks {
namespace {

std::string iso8601(const std::chrono::system_clock::time_point point) {
  return core::format_wall_clock(point, "%Y-%m-%dT%H:%M:%S%z");
}

}  // namespace

nlohmann::json to_json(const model::BenchResult& result) {
  return nlohmann::json{{"job_id", result.job_id},
                        {"ip_addrs", result.target_hosts},
                        {"pass", result.pass},
                        {"score", result.score},
                        {"message", result.message},
                        {"error", result.errors},
                        {"log", result.logs},
                        {"load_level", result.load_level},
                        {"start_time", iso8601(result.start_time)},
                        {"end_time", iso8601(result.end_time)}};
}

void write_result_file(const model::BenchResult& result, const std::string& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("unable to open result file: " + path);
  }
  out << to_json(result).dump() << '\n';
  if (!out.good()) {
    throw std::runtime_error("failed writing result file: " + path);
  }
}

}  // namespace load_bench::sinks
