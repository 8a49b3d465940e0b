#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace load_bench::core {

class ErrorLog {
 public:
  void append(std::string message);
  [[nodiscard]] std::vector<std::string> snapshot() const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> messages_{};
};

}  // namespace load_bench::core
