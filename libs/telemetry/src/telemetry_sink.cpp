#include "ledgercore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

#include "ledgercore/telemetry/metric_ids.hpp"

namespace ledgercore {
namespace telemetry {

std::string_view metrics::name_of(std::uint64_t id) noexcept {
  switch (id) {
    case kCommitsApplied:
      return "commits_applied";
    case kCommitsRejected:
      return "commits_rejected";
    case kCommitConflicts:
      return "commit_conflicts";
    case kEntriesAccepted:
      return "entries_accepted";
    case kEntriesRejected:
      return "entries_rejected";
    case kInvoicesCreated:
      return "invoices_created";
    case kLineMutations:
      return "line_mutations";
    case kLinesRejected:
      return "lines_rejected";
    case kTotalsRecomputed:
      return "totals_recomputed";
    case kTotalsRecomputeLatency:
      return "totals_recompute_latency";
    case kJournalRecordsWritten:
      return "journal_records_written";
    case kJournalRecordsReplayed:
      return "journal_records_replayed";
    default:
      return "unknown";
  }
}

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
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
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

void TelemetrySink::push(Sample sample) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(sample);
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  push(Sample{.id = id, .value = delta});
}

void TelemetrySink::record_latency(std::uint64_t id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[id % kMaxMetricId].record(latency.count());
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::map<std::uint64_t, std::int64_t> TelemetrySink::drain_counters() {
  std::map<std::uint64_t, std::int64_t> totals;
  for (const auto& sample : drain()) {
    totals[sample.id] += sample.value;
  }
  return totals;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;

  for (std::size_t idx = 0; idx < kMaxMetricId; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .id = static_cast<std::uint64_t>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });
    hist.reset();
  }

  return summaries;
}

ScopedLatency::~ScopedLatency() {
  if (sink_) {
    sink_->record_latency(id_, std::chrono::steady_clock::now() - start_);
  }
}

}  // namespace telemetry
}  // namespace ledgercore
