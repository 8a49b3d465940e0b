#pragma once

#include <optional>
#include <string>
#include <utility>

namespace load_bench::model {

// Failure reported by a check or load operation. Fatal errors abort the whole run
// when raised during continuous validation.
struct BenchError {
  std::string message;
  bool fatal{false};

  static BenchError failure(std::string message) { return BenchError{std::move(message), false}; }
  static BenchError fatal_error(std::string message) { return BenchError{std::move(message), true}; }
};

// std::nullopt means the operation succeeded.
using OpResult = std::optional<BenchError>;

}  // namespace load_bench::model
