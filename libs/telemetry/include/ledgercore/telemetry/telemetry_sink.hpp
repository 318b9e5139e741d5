#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <vector>

namespace ledgercore {
namespace telemetry {

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// Log2-bucketed latency histogram, 1ns up to roughly one second.
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Thread-safe collector shared by the services. Libraries only record; the
// daemon drains and prints.
class TelemetrySink {
 public:
  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);
  void record_latency(std::uint64_t id, std::chrono::nanoseconds latency);

  [[nodiscard]] std::vector<Sample> drain();
  // Drains raw samples and folds them into one total per metric id.
  [[nodiscard]] std::map<std::uint64_t, std::int64_t> drain_counters();

  struct Summary {
    std::uint64_t id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  static constexpr std::size_t kMaxMetricId = 64;

  std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::array<StreamingHistogram, kMaxMetricId> histograms_{};
};

// Records the elapsed steady time into a sink when it goes out of scope.
class ScopedLatency {
 public:
  ScopedLatency(TelemetrySink* sink, std::uint64_t id) noexcept
      : sink_(sink), id_(id), start_(std::chrono::steady_clock::now()) {}
  ScopedLatency(const ScopedLatency&) = delete;
  ScopedLatency& operator=(const ScopedLatency&) = delete;
  ~ScopedLatency();

 private:
  TelemetrySink* sink_;
  std::uint64_t id_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace telemetry
}  // namespace ledgercore
