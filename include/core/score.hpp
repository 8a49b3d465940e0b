#pragma once

#include <cstdint>

#include "core/counter.hpp"

namespace load_bench::core {

inline constexpr const char* kGetPrefix = "GET|/";
inline constexpr const char* kFetchPrefix = "GET|/fetch";
inline constexpr const char* kPostPrefix = "POST|/";
inline constexpr const char* kMessageCountPrefix = "get-message-count";
inline constexpr const char* kStaticNotModifiedKey = "staticfile-304";
inline constexpr const char* kLoadLevelUpKey = "load-level-up";

struct ScoreInputs {
  std::int64_t get_count{0};
  std::int64_t fetch_count{0};
  std::int64_t not_modified_count{0};
  std::int64_t post_count{0};
  std::int64_t message_count{0};
};

ScoreInputs collect_score_inputs(const Counter& counter);

// GET scores 1 except fetches and 304s; POST scores 3; 304s trickle in at 1 per 100.
constexpr std::int64_t compute_score(const ScoreInputs& inputs) noexcept {
  return 1 * (inputs.get_count - inputs.fetch_count - inputs.not_modified_count) + 3 * inputs.post_count +
         1 * inputs.message_count + inputs.not_modified_count / 100;
}

}  // namespace load_bench::core
