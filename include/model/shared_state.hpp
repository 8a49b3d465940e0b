#pragma once

namespace load_bench::model {

// Mutable state shared by every operation of a run. Implementations must be safe to use
// from many threads at once; the orchestrator only guarantees the object outlives every
// in-flight call.
class SharedState {
 public:
  virtual void init() {}
  virtual ~SharedState() = default;
};

}  // namespace load_bench::model
