#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>

#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore::tests {

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  sink.push({.id = telemetry::metrics::kCommitsApplied, .value = 99});
  sink.increment(telemetry::metrics::kCommitsApplied, 2);
  sink.increment(telemetry::metrics::kEntriesRejected);
  sink.record_latency(telemetry::metrics::kTotalsRecomputeLatency, std::chrono::nanoseconds{100});
  sink.record_latency(telemetry::metrics::kTotalsRecomputeLatency, std::chrono::nanoseconds{200});

  auto samples = sink.drain();
  assert(samples.size() == 3);
  assert(sink.drain().empty());

  sink.increment(telemetry::metrics::kCommitsApplied);
  sink.increment(telemetry::metrics::kCommitsApplied, 4);
  auto counters = sink.drain_counters();
  assert(counters.size() == 1);
  assert(counters[telemetry::metrics::kCommitsApplied] == 5);

  auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().id == telemetry::metrics::kTotalsRecomputeLatency);
  assert(latency.front().count == 2);
  assert(latency.front().mean_ns > 0.0);
  assert(sink.drain_latency().empty());

  assert(telemetry::metrics::name_of(telemetry::metrics::kLineMutations) != "unknown");
}

void test_scoped_latency() {
  telemetry::TelemetrySink sink;
  {
    telemetry::ScopedLatency latency(&sink, telemetry::metrics::kTotalsRecomputeLatency);
  }
  {
    telemetry::ScopedLatency disabled(nullptr, telemetry::metrics::kTotalsRecomputeLatency);
  }
  auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().count == 1);
}

}  // namespace ledgercore::tests
