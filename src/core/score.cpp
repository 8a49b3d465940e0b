#include "core/score.hpp"

namespace load_bench::core {

ScoreInputs collect_score_inputs(const Counter& counter) {
  ScoreInputs inputs{};
  inputs.get_count = counter.sum_prefix(kGetPrefix);
  inputs.fetch_count = counter.sum_prefix(kFetchPrefix);
  inputs.post_count = counter.sum_prefix(kPostPrefix);
  inputs.message_count = counter.sum_prefix(kMessageCountPrefix);
  inputs.not_modified_count = counter.get(kStaticNotModifiedKey);
  return inputs;
}

}  // namespace load_bench::core
