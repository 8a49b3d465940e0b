#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/bench_result.hpp"

namespace load_bench::sinks {

nlohmann::json to_json(const model::BenchResult& result);

// Throws std::runtime_error when the file cannot be written.
void write_result_file(const model::BenchResult& result, const std::string& path);

}  // namespace load_bench::sinks
