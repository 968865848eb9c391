#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace paycore {
namespace common {

// Bounded single-producer single-consumer queue. One slot is kept free to
// tell full from empty, so a ring of N slots holds at most N - 1 values.
template <typename T>
class SpscRing {
 public:
  explicit SpscRing(std::size_t capacity_power_of_two)
      : slots_(capacity_power_of_two), mask_(capacity_power_of_two - 1) {
    if (capacity_power_of_two < 2 || (capacity_power_of_two & mask_) != 0) {
      throw std::invalid_argument("SpscRing capacity must be a power of two >= 2");
    }
  }

  SpscRing(const SpscRing&) = delete;
  SpscRing& operator=(const SpscRing&) = delete;

  // Producer side. Returns false without consuming `value` when the ring is full.
  bool push(T& value) {
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t next_head = (head + 1) & mask_;
    if (next_head == tail_.load(std::memory_order_acquire)) {
      return false;
    }
    slots_[head].emplace(std::move(value));
    head_.store(next_head, std::memory_order_release);
    return true;
  }

  // Consumer side.
  bool pop(T& out) {
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    if (tail == head_.load(std::memory_order_acquire)) {
      return false;
    }
    out = std::move(*slots_[tail]);
    slots_[tail].reset();
    tail_.store((tail + 1) & mask_, std::memory_order_release);
    return true;
  }

  [[nodiscard]] bool empty() const {
    return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
  }

 private:
  std::vector<std::optional<T>> slots_;
  const std::size_t mask_;
  std::atomic<std::size_t> head_{0};
  std::atomic<std::size_t> tail_{0};
};

}  // namespace common
}  // namespace paycore
