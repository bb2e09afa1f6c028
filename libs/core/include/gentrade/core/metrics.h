#pragma once

#include <atomic>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <memory>
#include <vector> // std::vector used for bucket boundaries

namespace gentrade::core {

// Names of the metrics registered by global_metrics()
namespace metric_names {
constexpr kj::StringPtr kJobsSubmitted = "gentrade_jobs_submitted_total"_kj;
constexpr kj::StringPtr kJobsFinished = "gentrade_jobs_finished_total"_kj;
constexpr kj::StringPtr kJobsFailed = "gentrade_jobs_failed_total"_kj;
constexpr kj::StringPtr kJobsRedelivered = "gentrade_jobs_redelivered_total"_kj;
constexpr kj::StringPtr kBrokerReconnects = "gentrade_broker_reconnects_total"_kj;
constexpr kj::StringPtr kBrokerSubmitFailures = "gentrade_broker_submit_failures_total"_kj;
constexpr kj::StringPtr kJobsInFlight = "gentrade_jobs_in_flight"_kj;
constexpr kj::StringPtr kJobDuration = "gentrade_job_duration_seconds"_kj;
} // namespace metric_names

class Metric {
public:
  explicit Metric(kj::StringPtr name, kj::StringPtr description)
      : name_(kj::heapString(name)), description_(kj::heapString(description)) {}
  virtual ~Metric() noexcept = default;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] kj::StringPtr description() const noexcept {
    return description_;
  }

private:
  kj::String name_;
  kj::String description_;
};

// Monotonically increasing
class Counter final : public Metric {
public:
  explicit Counter(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    count_ += value;
  }
  [[nodiscard]] int64_t value() const noexcept {
    return count_.load();
  }

private:
  std::atomic<int64_t> count_{0};
};

class Gauge final : public Metric {
public:
  explicit Gauge(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    value_ += value;
  }
  void decrement(int64_t value = 1) noexcept {
    value_ -= value;
  }
  void set(int64_t value) noexcept {
    value_.store(value);
  }
  [[nodiscard]] int64_t value() const noexcept {
    return value_.load();
  }

private:
  std::atomic<int64_t> value_{0};
};

class Histogram final : public Metric {
public:
  explicit Histogram(kj::StringPtr name, kj::StringPtr description,
                     std::vector<double> buckets = default_buckets())
      : Metric(name, description), buckets_(kj::mv(buckets)),
        bucket_counts_(std::make_unique<std::atomic<int64_t>[]>(buckets_.size())) {
    for (size_t i = 0; i < buckets_.size(); ++i) {
      bucket_counts_[i].store(0);
    }
  }

  void observe(double value) noexcept {
    count_++;
    double current = sum_.load();
    while (!sum_.compare_exchange_weak(current, current + value)) {
    }
    for (size_t i = 0; i < buckets_.size(); ++i) {
      if (value <= buckets_[i]) {
        bucket_counts_[i].fetch_add(1);
      }
    }
  }

  [[nodiscard]] int64_t count() const noexcept {
    return count_.load();
  }
  [[nodiscard]] double sum() const noexcept {
    return sum_.load();
  }
  [[nodiscard]] const std::vector<double>& buckets() const noexcept {
    return buckets_;
  }
  [[nodiscard]] int64_t bucket_count(size_t index) const noexcept {
    return bucket_counts_[index].load();
  }

  // Backtests run for seconds to hours
  static std::vector<double> default_buckets() {
    return {0.1, 0.5, 1.0, 5.0, 10.0, 30.0, 60.0, 120.0, 300.0, 600.0, 1800.0, 3600.0};
  }

private:
  std::vector<double> buckets_;
  std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;
  std::atomic<int64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

class MetricsRegistry final {
public:
  MetricsRegistry() = default;

  void register_counter(kj::StringPtr name, kj::StringPtr description);
  void register_gauge(kj::StringPtr name, kj::StringPtr description);
  void register_histogram(kj::StringPtr name, kj::StringPtr description,
                          std::vector<double> buckets = Histogram::default_buckets());

  // Pointers stay valid for the registry's lifetime; nullptr if not registered
  [[nodiscard]] Counter* counter(kj::StringPtr name);
  [[nodiscard]] Gauge* gauge(kj::StringPtr name);
  [[nodiscard]] Histogram* histogram(kj::StringPtr name);

  // Prometheus text exposition format
  [[nodiscard]] kj::String to_prometheus() const;

private:
  struct RegistryState {
    kj::TreeMap<kj::String, kj::Own<Counter>> counters;
    kj::TreeMap<kj::String, kj::Own<Gauge>> gauges;
    kj::TreeMap<kj::String, kj::Own<Histogram>> histograms;
  };

  kj::MutexGuarded<RegistryState> guarded_;
};

[[nodiscard]] MetricsRegistry& global_metrics();

inline void counter_inc(kj::StringPtr name, int64_t value = 1) {
  if (auto c = global_metrics().counter(name)) {
    c->increment(value);
  }
}

inline int64_t counter_get(kj::StringPtr name) {
  if (auto c = global_metrics().counter(name)) {
    return c->value();
  }
  return 0;
}

inline void gauge_inc(kj::StringPtr name, int64_t value = 1) {
  if (auto g = global_metrics().gauge(name)) {
    g->increment(value);
  }
}

inline void gauge_dec(kj::StringPtr name, int64_t value = 1) {
  if (auto g = global_metrics().gauge(name)) {
    g->decrement(value);
  }
}

inline int64_t gauge_get(kj::StringPtr name) {
  if (auto g = global_metrics().gauge(name)) {
    return g->value();
  }
  return 0;
}

inline void histogram_observe(kj::StringPtr name, double value) {
  if (auto h = global_metrics().histogram(name)) {
    h->observe(value);
  }
}

} // namespace gentrade::core
