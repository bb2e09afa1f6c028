#include "gentrade/core/metrics.h"

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string-tree.h>

namespace gentrade::core {

void MetricsRegistry::register_counter(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  lock->counters.upsert(kj::str(name), kj::heap<Counter>(name, description),
                        [](auto&, auto&&) {});
}

void MetricsRegistry::register_gauge(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  lock->gauges.upsert(kj::str(name), kj::heap<Gauge>(name, description), [](auto&, auto&&) {});
}

void MetricsRegistry::register_histogram(kj::StringPtr name, kj::StringPtr description,
                                         std::vector<double> buckets) {
  auto lock = guarded_.lockExclusive();
  lock->histograms.upsert(kj::str(name), kj::heap<Histogram>(name, description, kj::mv(buckets)),
                          [](auto&, auto&&) {});
}

Counter* MetricsRegistry::counter(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->counters.find(name)) {
    return value.get();
  }
  return nullptr;
}

Gauge* MetricsRegistry::gauge(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->gauges.find(name)) {
    return value.get();
  }
  return nullptr;
}

Histogram* MetricsRegistry::histogram(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->histograms.find(name)) {
    return value.get();
  }
  return nullptr;
}

kj::String MetricsRegistry::to_prometheus() const {
  auto lock = guarded_.lockExclusive();

  kj::Vector<kj::StringTree> lines;

  for (const auto& entry : lock->counters) {
    const auto& counter = entry.value;
    if (counter->description().size() > 0) {
      lines.add(kj::strTree("# HELP ", entry.key, " ", counter->description(), "\n"));
    }
    lines.add(kj::strTree("# TYPE ", entry.key, " counter\n"));
    lines.add(kj::strTree(entry.key, " ", counter->value(), "\n"));
  }

  for (const auto& entry : lock->gauges) {
    const auto& gauge = entry.value;
    if (gauge->description().size() > 0) {
      lines.add(kj::strTree("# HELP ", entry.key, " ", gauge->description(), "\n"));
    }
    lines.add(kj::strTree("# TYPE ", entry.key, " gauge\n"));
    lines.add(kj::strTree(entry.key, " ", gauge->value(), "\n"));
  }

  for (const auto& entry : lock->histograms) {
    const auto& histogram = entry.value;
    if (histogram->description().size() > 0) {
      lines.add(kj::strTree("# HELP ", entry.key, " ", histogram->description(), "\n"));
    }
    lines.add(kj::strTree("# TYPE ", entry.key, " histogram\n"));
    for (size_t i = 0; i < histogram->buckets().size(); ++i) {
      lines.add(kj::strTree(entry.key, "_bucket{le=\"", histogram->buckets()[i], "\"} ",
                            histogram->bucket_count(i), "\n"));
    }
    lines.add(kj::strTree(entry.key, "_bucket{le=\"+Inf\"} ", histogram->count(), "\n"));
    lines.add(kj::strTree(entry.key, "_sum ", histogram->sum(), "\n"));
    lines.add(kj::strTree(entry.key, "_count ", histogram->count(), "\n"));
  }

  return kj::StringTree(lines.releaseAsArray(), ""_kj).flatten();
}

struct GlobalMetricsState {
  kj::Maybe<kj::Own<MetricsRegistry>> registry{kj::none};
};
static kj::MutexGuarded<GlobalMetricsState> g_metrics_registry;

MetricsRegistry& global_metrics() {
  auto lock = g_metrics_registry.lockExclusive();
  KJ_IF_SOME(registry, lock->registry) {
    return *registry;
  }
  auto registry = kj::heap<MetricsRegistry>();

  registry->register_counter(metric_names::kJobsSubmitted, "Jobs accepted by the broker"_kj);
  registry->register_counter(metric_names::kJobsFinished, "Jobs that reached finished"_kj);
  registry->register_counter(metric_names::kJobsFailed, "Jobs that reached failed"_kj);
  registry->register_counter(metric_names::kJobsRedelivered,
                             "Deliveries for jobs already past created"_kj);
  registry->register_counter(metric_names::kBrokerReconnects,
                             "Broker connections replaced after a failure"_kj);
  registry->register_counter(metric_names::kBrokerSubmitFailures,
                             "Submissions rejected with BrokerUnavailable"_kj);
  registry->register_gauge(metric_names::kJobsInFlight, "Jobs currently executing"_kj);
  registry->register_histogram(metric_names::kJobDuration, "Job pipeline wall time in seconds"_kj);

  MetricsRegistry& ref = *registry;
  lock->registry = kj::mv(registry);
  return ref;
}

} // namespace gentrade::core
