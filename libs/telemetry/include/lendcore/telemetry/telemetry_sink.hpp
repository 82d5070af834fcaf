#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace lendcore {
namespace telemetry {

// Metric ids: counters live below kLatencyBase, latency histograms at or above it.
namespace metric {
inline constexpr std::uint64_t kCommitted = 100;       // + transition kind
inline constexpr std::uint64_t kRejected = 200;        // + transition kind
inline constexpr std::uint64_t kStatus = 300;          // + executor status
inline constexpr std::uint64_t kTransferFailures = 400;
inline constexpr std::uint64_t kReentrantCalls = 401;
inline constexpr std::uint64_t kQueries = 402;
inline constexpr std::uint64_t kLatencyBase = 900;     // + transition kind
}  // namespace metric

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// Log2 latency histogram: bucket[i] covers [2^(i-1), 2^i) nanoseconds, 30 buckets up to ~1s.
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

class TelemetrySink {
 public:
  explicit TelemetrySink(bool enabled = true, std::size_t buffer_size = 1024);

  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);
  void record_latency(std::uint64_t id, std::chrono::nanoseconds latency);

  // Running total of every increment/push for `id`, unaffected by drain().
  [[nodiscard]] std::int64_t counter(std::uint64_t id) const;
  [[nodiscard]] std::vector<Sample> drain();
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

  struct Summary {
    std::uint64_t id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  static constexpr std::size_t kMaxHistograms = 64;

  bool enabled_;
  std::size_t buffer_size_;
  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::unordered_map<std::uint64_t, std::int64_t> totals_{};
  std::array<StreamingHistogram, kMaxHistograms> histograms_{};
  std::array<std::uint64_t, kMaxHistograms> histogram_ids_{};
};

}  // namespace telemetry
}  // namespace lendcore
