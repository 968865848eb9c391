#pragma once

#include <chrono>

namespace paycore {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

// Measures the steady-clock time elapsed since construction.
class Stopwatch {
 public:
  Stopwatch() noexcept : start_(now_steady()) {}

  [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept { return now_steady() - start_; }

 private:
  std::chrono::nanoseconds start_;
};

}  // namespace common
}  // namespace paycore
