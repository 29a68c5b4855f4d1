#include <taskd/server/metrics.hpp>

#include <drogon/drogon.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace taskd::server {

namespace {

// Upper bounds of the latency buckets, in milliseconds. +Inf is implicit.
const std::vector<double> kBucketBounds = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

constexpr const char* kTimerAttribute = "taskd.request_timer";

std::string FormatValue(double value) {
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

void AppendFamily(std::string* out, const std::string& name, const char* type) {
  *out += "# TYPE " + name + " " + type + "\n";
}

void AppendSample(std::string* out, const std::string& series,
                  const std::string& value) {
  *out += series + " " + value + "\n";
}

}  // namespace

// --- LatencyHistogram ---

LatencyHistogram::LatencyHistogram() : cumulative_(kBucketBounds.size() + 1, 0) {}

void LatencyHistogram::Observe(double value) {
  auto first = std::lower_bound(kBucketBounds.begin(), kBucketBounds.end(), value);
  for (size_t i = static_cast<size_t>(first - kBucketBounds.begin());
       i < cumulative_.size(); ++i) {
    ++cumulative_[i];
  }
  ++count_;
  sum_ += value;
}

void LatencyHistogram::AppendSamples(const std::string& name,
                                     std::string* out) const {
  for (size_t i = 0; i < cumulative_.size(); ++i) {
    std::string le = i < kBucketBounds.size() ? FormatValue(kBucketBounds[i]) : "+Inf";
    AppendSample(out, name + "_bucket{le=\"" + le + "\"}",
                 std::to_string(cumulative_[i]));
  }
  AppendSample(out, name + "_sum", FormatValue(sum_));
  AppendSample(out, name + "_count", std::to_string(count_));
}

// --- PrometheusMetrics ---

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  histograms_[std::string(name)].Observe(static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& route,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  ++requests_[RequestLabels(method, route, status_code)];
  request_latency_.Observe(latency_ms);
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::string out;

  for (const auto& [name, value] : counters_) {
    AppendFamily(&out, name, "counter");
    AppendSample(&out, name, std::to_string(value));
  }

  for (const auto& [name, value] : gauges_) {
    AppendFamily(&out, name, "gauge");
    AppendSample(&out, name, FormatValue(value));
  }

  for (const auto& [name, histogram] : histograms_) {
    AppendFamily(&out, name, "histogram");
    histogram.AppendSamples(name, &out);
  }

  if (!requests_.empty()) {
    const std::string family = "taskd_http_requests_total";
    AppendFamily(&out, family, "counter");
    for (const auto& [labels, count] : requests_) {
      const auto& [method, route, status] = labels;
      AppendSample(&out,
                   family + "{method=\"" + method + "\",path=\"" + route +
                       "\",status=\"" + std::to_string(status) + "\"}",
                   std::to_string(count));
    }
  }

  if (request_latency_.count() > 0) {
    const std::string family = "taskd_http_request_duration_ms";
    AppendFamily(&out, family, "histogram");
    request_latency_.AppendSamples(family, &out);
  }

  return out;
}

std::string RouteLabel(const std::string& path) {
  static const std::string kPrefix = "/tasks/";
  if (path.compare(0, kPrefix.size(), kPrefix) != 0 ||
      path.size() == kPrefix.size()) {
    return path;
  }

  size_t id_end = path.find('/', kPrefix.size());
  if (id_end == std::string::npos) {
    return "/tasks/{id}";
  }
  return "/tasks/{id}" + path.substr(id_end);
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            TaskService* service,
                            const MetricsConfig& config) {
  auto& app = drogon::app();

  // Time every routed request; the timer records when it is released.
  app.registerPreHandlingAdvice([metrics](const drogon::HttpRequestPtr& req) {
    req->attributes()->insert(
        kTimerAttribute,
        std::make_shared<RequestTimer>(metrics, req->methodString(),
                                       RouteLabel(req->path())));
  });

  app.registerPostHandlingAdvice([](const drogon::HttpRequestPtr& req,
                                    const drogon::HttpResponsePtr& resp) {
    auto attributes = req->attributes();
    if (!attributes->find(kTimerAttribute)) return;

    auto timer = attributes->get<std::shared_ptr<RequestTimer>>(kTimerAttribute);
    attributes->erase(kTimerAttribute);
    if (timer) {
      timer->SetStatusCode(static_cast<int>(resp->statusCode()));
    }
  });

  app.registerHandler(
      config.path,
      [metrics, service](const drogon::HttpRequestPtr& req,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        // Collect collection gauges
        if (service) {
          uint64_t todo = 0, in_progress = 0, done = 0;
          for (const auto& task : service->store()->Load()) {
            switch (task.status) {
              case TaskStatus::kTodo:
                ++todo;
                break;
              case TaskStatus::kInProgress:
                ++in_progress;
                break;
              case TaskStatus::kDone:
                ++done;
                break;
            }
          }
          metrics->Gauge("taskd_tasks_todo", static_cast<double>(todo));
          metrics->Gauge("taskd_tasks_in_progress", static_cast<double>(in_progress));
          metrics->Gauge("taskd_tasks_done", static_cast<double>(done));
          metrics->Gauge("taskd_tasks_total",
                         static_cast<double>(todo + in_progress + done));
        }

        // Export metrics
        std::string output = metrics->Export();

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(output);
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string route)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      route_(std::move(route)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (!metrics_) return;
  std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - start_;
  metrics_->RecordHttpRequest(method_, route_, status_code_, elapsed.count());
}

}  // namespace taskd::server
