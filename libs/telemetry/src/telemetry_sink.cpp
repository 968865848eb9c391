#include "paycore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace paycore {
namespace telemetry {

std::string_view to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kRecordsApplied:
      return "records_applied";
    case Metric::kRejectedDuplicate:
      return "rejected_duplicate_transaction";
    case Metric::kRejectedLocked:
      return "rejected_account_locked";
    case Metric::kRejectedInsufficientFunds:
      return "rejected_insufficient_funds";
    case Metric::kRejectedUnknown:
      return "rejected_unknown_transaction";
    case Metric::kRejectedInvalidState:
      return "rejected_invalid_state";
    case Metric::kMalformedRecords:
      return "malformed_records";
    case Metric::kApplyLatency:
      return "apply_latency";
  }
  return "unknown_metric";
}

// StreamingHistogram implementation

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  // 3 * 2^(idx-2) = 1.5 * 2^(idx-1)
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  const auto idx = bucket_index(value_ns);
  ++buckets_[idx];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;

  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }

  return static_cast<double>(max_);
}

// TelemetrySink implementation

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  counters_[metric] += delta;
}

void TelemetrySink::record_latency(Metric metric, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[metric].record(latency.count());
}

std::int64_t TelemetrySink::counter(Metric metric) const {
  std::scoped_lock lock(mutex_);
  if (auto it = counters_.find(metric); it != counters_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<Sample> samples;
  samples.reserve(counters_.size());
  for (const auto& [metric, value] : counters_) {
    samples.push_back(Sample{.metric = metric, .value = value});
  }
  counters_.clear();
  return samples;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;

  for (auto& [metric, hist] : histograms_) {
    if (hist.count() == 0) {
      continue;
    }

    summaries.push_back(Summary{
        .metric = metric,
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });

    hist.reset();
  }

  return summaries;
}

}  // namespace telemetry
}  // namespace paycore
