#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace load_bench::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

long long parse_positive(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

std::string require_path(const std::string& key, const std::string& path) {
  if (path.empty() || path.front() != '/') {
    throw std::runtime_error(key + " entries must start with '/': " + path);
  }
  return path;
}

std::vector<WeightedPath> parse_weighted_paths(const std::string& key, const std::string& value) {
  std::vector<WeightedPath> paths;
  for (const auto& item : split_list(value)) {
    const auto split = item.rfind('=');
    if (split == std::string::npos) {
      paths.push_back(WeightedPath{require_path(key, item), 1});
      continue;
    }

    const auto weight = std::stoi(item.substr(split + 1));
    if (weight < 1) {
      throw std::runtime_error(key + " weights must be at least 1");
    }
    paths.push_back(WeightedPath{require_path(key, trim(item.substr(0, split))), weight});
  }
  return paths;
}

void apply_key_value(BenchConfig& config, const std::string& key, const std::string& value) {
  if (key == "bench.duration_s") {
    config.duration = std::chrono::seconds(parse_positive(key, value));
    return;
  }

  if (key == "bench.no_level_up") {
    config.no_level_up = parse_bool(value);
    return;
  }

  if (key == "bench.pre_test_only") {
    config.pre_test_only = parse_bool(value);
    return;
  }

  if (key == "bench.baseline_workers") {
    config.baseline_workers = static_cast<std::size_t>(parse_positive(key, value));
    return;
  }

  if (key == "bench.level_up_burst") {
    config.level_up_burst = static_cast<std::size_t>(parse_positive(key, value));
    return;
  }

  if (key == "bench.tick_ms") {
    config.tick_interval = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "bench.signal_window_ms") {
    config.signal_window = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "bench.validation_penalty_ms") {
    const auto penalty = std::stoll(value);
    if (penalty < 0) {
      throw std::runtime_error("bench.validation_penalty_ms must be greater than or equal to 0");
    }
    config.validation_penalty = std::chrono::milliseconds(penalty);
    return;
  }

  if (key == "bench.seed") {
    const auto seed = std::stoll(value);
    if (seed < 0 || seed > 0xFFFFFFFFLL) {
      throw std::runtime_error("bench.seed must fit in 32 bits");
    }
    config.seed = static_cast<std::uint32_t>(seed);
    return;
  }

  if (key == "bench.job_id") {
    config.job_id = value;
    return;
  }

  if (key == "target.hosts") {
    config.target.hosts = split_list(value);
    if (config.target.hosts.empty()) {
      throw std::runtime_error("target.hosts must name at least one host");
    }
    return;
  }

  if (key == "target.host_header") {
    config.target.host_header = value;
    return;
  }

  if (key == "target.request_timeout_ms") {
    config.target.request_timeout = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "target.initialize_timeout_ms") {
    config.target.initialize_timeout = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "target.slow_threshold_ms") {
    config.target.slow_threshold = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "scenario.checks") {
    config.scenario.checks.clear();
    for (const auto& path : split_list(value)) {
      config.scenario.checks.push_back(require_path(key, path));
    }
    return;
  }

  if (key == "scenario.loads") {
    config.scenario.loads = parse_weighted_paths(key, value);
    return;
  }

  if (key == "scenario.level_up_loads") {
    config.scenario.level_up_loads = parse_weighted_paths(key, value);
    return;
  }

  if (key == "output.path") {
    config.output_path = value;
    return;
  }

  if (key == "output.stdout_summary") {
    config.stdout_summary = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = std::stoi(value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = db;
  }
}

}  // namespace

BenchConfig load_bench_config(const std::string& path) {
  BenchConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": " + full_key.str() +
                               ": not a number: " + value);
    } catch (const std::out_of_range&) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": " + full_key.str() +
                               ": out of range: " + value);
    } catch (const std::runtime_error& ex) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": " + ex.what());
    }
  }

  return config;
}

}  // namespace load_bench::core
