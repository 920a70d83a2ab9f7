/**
 * @file metrics.hpp
 * @brief Pluggable metrics sink for bulkhead and semaphore instrumentation.
 *
 * Emitted names (instance = bulkhead or semaphore name):
 *   bulkhead.executed / rejected / timeout / error      counters
 *   bulkhead.active / queued                            gauges
 *   bulkhead.execution_time_ms / wait_time_ms           histograms
 *   semaphore.acquired / timeout                        counters
 *   semaphore.available                                 gauge
 *
 * A sink that throws never affects task outcomes: every emit is guarded
 * and the failure is logged.
 */

#ifndef ISOL_METRICS_HPP_
#define ISOL_METRICS_HPP_

#include "isol/log.hpp"

#include <cstdint>

#include <exception>
#include <string>

namespace isol {

class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  virtual void Counter(const char* metric, const std::string& instance, uint64_t delta) = 0;
  virtual void Gauge(const char* metric, const std::string& instance, double value) = 0;
  virtual void Histogram(const char* metric, const std::string& instance, double value) = 0;
};

/** @brief Discards everything. Default sink for all components. */
class NullMetricsSink final : public MetricsSink {
 public:
  static NullMetricsSink& Instance() noexcept {
    static NullMetricsSink sink;
    return sink;
  }

  void Counter(const char*, const std::string&, uint64_t) override {}
  void Gauge(const char*, const std::string&, double) override {}
  void Histogram(const char*, const std::string&, double) override {}
};

namespace detail {

template <typename Fn>
inline void SafeEmit(const char* metric, Fn&& fn) noexcept {
  try {
    fn();
  } catch (const std::exception& e) {
    ISOL_LOG_WARN("Metrics", "emit %s failed: %s", metric, e.what());
  } catch (...) {
    ISOL_LOG_WARN("Metrics", "emit %s failed: unknown exception", metric);
  }
}

}  // namespace detail

inline void EmitCounter(MetricsSink& sink, const char* metric, const std::string& instance,
                        uint64_t delta = 1U) noexcept {
  detail::SafeEmit(metric, [&] { sink.Counter(metric, instance, delta); });
}

inline void EmitGauge(MetricsSink& sink, const char* metric, const std::string& instance,
                      double value) noexcept {
  detail::SafeEmit(metric, [&] { sink.Gauge(metric, instance, value); });
}

inline void EmitHistogram(MetricsSink& sink, const char* metric, const std::string& instance,
                          double value) noexcept {
  detail::SafeEmit(metric, [&] { sink.Histogram(metric, instance, value); });
}

}  // namespace isol

#endif  // ISOL_METRICS_HPP_
