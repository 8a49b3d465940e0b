#include "core/error_log.hpp"

#include <utility>

namespace load_bench::core {

void ErrorLog::append(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  messages_.push_back(std::move(message));
}

std::vector<std::string> ErrorLog::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_;
}

std::size_t ErrorLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

}  // namespace load_bench::core
