#pragma once

#include <taskd/server/config.hpp>
#include <taskd/task_service.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace taskd::server {

/**
 * Cumulative histogram over fixed millisecond buckets.
 * Not synchronized; PrometheusMetrics guards its instances.
 */
class LatencyHistogram {
 public:
  LatencyHistogram();

  void Observe(double value);

  uint64_t count() const { return count_; }
  double sum() const { return sum_; }

  /** Append `<name>_bucket`, `<name>_sum` and `<name>_count` samples. */
  void AppendSamples(const std::string& name, std::string* out) const;

 private:
  std::vector<uint64_t> cumulative_;  // one slot per bound, plus +Inf
  uint64_t count_ = 0;
  double sum_ = 0.0;
};

/**
 * MetricsSink that renders the Prometheus text exposition format.
 * Families are exported in name order.
 */
class PrometheusMetrics : public taskd::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Count one served request. route should come from RouteLabel so that
   * label cardinality stays bounded by the route table.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& route,
                         int status_code,
                         double latency_ms);

  std::string Export() const;

 private:
  // (method, route, status)
  using RequestLabels = std::tuple<std::string, std::string, int>;

  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, LatencyHistogram> histograms_;
  std::map<RequestLabels, uint64_t> requests_;
  LatencyHistogram request_latency_;
};

/**
 * Collapse a request path to its route pattern:
 *   /tasks/3f2a.../status -> /tasks/{id}/status
 */
std::string RouteLabel(const std::string& path);

/**
 * Register the metrics endpoint at config.path, plus request advices that
 * time every request and record it.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            TaskService* service,
                            const MetricsConfig& config);

/**
 * Times one request from construction and records it with the status set
 * last when destroyed. Held in the request's attributes between advices.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
               std::string method,
               std::string route);
  ~RequestTimer();

  RequestTimer(const RequestTimer&) = delete;
  RequestTimer& operator=(const RequestTimer&) = delete;

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::string method_;
  std::string route_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace taskd::server
