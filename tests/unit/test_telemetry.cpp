#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>

#include "paycore/telemetry/telemetry_sink.hpp"

namespace paycore::tests {

void test_telemetry_sink() {
  using telemetry::Metric;

  telemetry::TelemetrySink sink;
  sink.increment(Metric::kRecordsApplied);
  sink.increment(Metric::kRecordsApplied, 2);
  sink.increment(Metric::kRejectedLocked);
  sink.record_latency(Metric::kApplyLatency, std::chrono::nanoseconds{100});
  sink.record_latency(Metric::kApplyLatency, std::chrono::nanoseconds{200});

  assert(sink.counter(Metric::kRecordsApplied) == 3);
  assert(sink.counter(Metric::kMalformedRecords) == 0);

  auto samples = sink.drain();
  assert(samples.size() == 2);
  assert(samples[0].metric == Metric::kRecordsApplied);
  assert(samples[0].value == 3);
  assert(samples[1].metric == Metric::kRejectedLocked);
  assert(sink.drain().empty());

  auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().metric == Metric::kApplyLatency);
  assert(latency.front().count == 2);
  assert(latency.front().mean_ns == 150.0);
  assert(sink.drain_latency().empty());

  telemetry::StreamingHistogram hist;
  assert(hist.percentile(0.99) == 0.0);
  hist.record(1);
  hist.record(1'000);
  assert(hist.count() == 2);
  assert(hist.max() == 1'000);
  assert(hist.percentile(0.5) == 1.0);
}

}  // namespace paycore::tests
