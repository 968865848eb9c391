#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

namespace paycore {
namespace telemetry {

enum class Metric : std::uint64_t {
  kRecordsApplied = 1,
  kRejectedDuplicate = 2,
  kRejectedLocked = 3,
  kRejectedInsufficientFunds = 4,
  kRejectedUnknown = 5,
  kRejectedInvalidState = 6,
  kMalformedRecords = 7,
  kApplyLatency = 8,
};

std::string_view to_string(Metric metric) noexcept;

struct Sample {
  Metric metric{Metric::kRecordsApplied};
  std::int64_t value{};
};

// Streaming histogram with O(1) recording and O(bucket_count) percentile computation.
// Uses log2-scale buckets from 1ns to ~1s (30 buckets).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Thread-safe counters and latency histograms shared by all ledger workers.
class TelemetrySink {
 public:
  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(Metric metric, std::chrono::nanoseconds latency);

  [[nodiscard]] std::int64_t counter(Metric metric) const;

  // Current counter values ordered by metric id; counters are reset.
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    Metric metric{Metric::kApplyLatency};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::map<Metric, std::int64_t> counters_{};
  std::map<Metric, StreamingHistogram> histograms_{};
};

}  // namespace telemetry
}  // namespace paycore
