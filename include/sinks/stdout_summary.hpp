#pragma once

#include "core/counter.hpp"
#include "model/bench_result.hpp"

namespace load_bench::sinks {

class StdoutSummarySink {
 public:
  void publish(const core::CounterSummary& summary) const;
  void publish(const model::BenchResult& result) const;
};

}  // namespace load_bench::sinks
