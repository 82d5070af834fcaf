#pragma once

#include <chrono>

namespace lendcore {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

class Stopwatch {
 public:
  Stopwatch() noexcept : start_(now_steady()) {}

  [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept { return now_steady() - start_; }

 private:
  std::chrono::nanoseconds start_;
};

}  // namespace common
}  // namespace lendcore
