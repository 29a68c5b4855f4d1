// Server tests for the taskd HTTP server
// Tests: Config parsing, metrics, error mapping, shutdown, and HTTP handlers

#include <gtest/gtest.h>

#include <taskd/server/config.hpp>
#include <taskd/server/handlers.hpp>
#include <taskd/server/metrics.hpp>
#include <taskd/shutdown.hpp>
#include <taskd/store.hpp>
#include <taskd/task_service.hpp>
#include <taskd/test_utils.hpp>

#include <drogon/drogon.h>

#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <random>
#include <thread>

namespace taskd::server {
namespace {

using taskd::testing::TempDir;

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
 protected:
  std::string WriteConfig(const std::string& contents) {
    auto path = (temp_dir_.path() / "taskd.yaml").string();
    std::ofstream(path) << contents;
    return path;
  }

  TempDir temp_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 3000);
  EXPECT_EQ(config.server.threads, 0u);
  EXPECT_EQ(config.server.log_level, "info");
  EXPECT_EQ(config.store.backend, StoreBackend::kFile);
  EXPECT_EQ(config.store.path, "tasks.json");
  EXPECT_FALSE(config.service.serialize_writes);
  EXPECT_TRUE(config.metrics.enabled);
  EXPECT_EQ(config.metrics.path, "/metrics");
}

TEST_F(ConfigTest, LoadFromArgs_DataPath) {
  const char* argv[] = {"taskd_server", "--data-path", "/data/tasks.json"};
  auto config = Config::LoadFromArgs(3, const_cast<char**>(argv));
  EXPECT_EQ(config.store.path, "/data/tasks.json");
}

TEST_F(ConfigTest, LoadFromArgs_Port) {
  const char* argv[] = {"taskd_server", "--port", "9090"};
  auto config = Config::LoadFromArgs(3, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 9090);
}

TEST_F(ConfigTest, LoadFromArgs_ShortPort) {
  const char* argv[] = {"taskd_server", "-p", "9091"};
  auto config = Config::LoadFromArgs(3, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 9091);
}

TEST_F(ConfigTest, LoadFromArgs_ServerFlags) {
  const char* argv[] = {"taskd_server", "--host", "127.0.0.1", "--threads", "4",
                        "--log-level", "debug"};
  auto config = Config::LoadFromArgs(7, const_cast<char**>(argv));
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.threads, 4u);
  EXPECT_EQ(config.server.log_level, "debug");
}

TEST_F(ConfigTest, LoadFromArgs_StoreAndServiceFlags) {
  const char* argv[] = {"taskd_server", "--backend", "rocksdb",
                        "--serialize-writes", "--no-metrics"};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  EXPECT_EQ(config.store.backend, StoreBackend::kRocksDB);
  EXPECT_TRUE(config.service.serialize_writes);
  EXPECT_FALSE(config.metrics.enabled);
}

TEST_F(ConfigTest, LoadFromArgs_InvalidValues) {
  const char* bad_port[] = {"taskd_server", "--port", "70000"};
  EXPECT_THROW(Config::LoadFromArgs(3, const_cast<char**>(bad_port)),
               std::runtime_error);

  const char* bad_number[] = {"taskd_server", "--threads", "four"};
  EXPECT_THROW(Config::LoadFromArgs(3, const_cast<char**>(bad_number)),
               std::runtime_error);

  const char* bad_backend[] = {"taskd_server", "--backend", "sqlite"};
  EXPECT_THROW(Config::LoadFromArgs(3, const_cast<char**>(bad_backend)),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_UnknownOption) {
  const char* argv[] = {"taskd_server", "--unknown-option"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_MissingValue) {
  const char* argv[] = {"taskd_server", "--data-path"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_Basic) {
  auto path = WriteConfig(
      "# taskd settings\n"
      "server:\n"
      "  host: \"127.0.0.1\"\n"
      "  port: 8081\n"
      "  threads: 8\n"
      "  log_level: warn\n"
      "store:\n"
      "  backend: memory\n"
      "  path: '/var/lib/taskd/tasks.json'\n"
      "  sync: false\n"
      "service:\n"
      "  serialize_writes: true\n");

  auto config = Config::LoadFromFile(path);
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 8081);
  EXPECT_EQ(config.server.threads, 8u);
  EXPECT_EQ(config.server.log_level, "warn");
  EXPECT_EQ(config.store.backend, StoreBackend::kMemory);
  EXPECT_EQ(config.store.path, "/var/lib/taskd/tasks.json");
  EXPECT_FALSE(config.store.sync);
  EXPECT_TRUE(config.service.serialize_writes);
}

TEST_F(ConfigTest, LoadFromFile_TopLevelDataPath) {
  auto path = WriteConfig("data_path: /srv/tasks.json\n");
  auto config = Config::LoadFromFile(path);
  EXPECT_EQ(config.store.path, "/srv/tasks.json");
}

TEST_F(ConfigTest, LoadFromFile_Metrics) {
  auto path = WriteConfig(
      "metrics:\n"
      "  enabled: false\n"
      "  path: /internal/metrics\n");

  auto config = Config::LoadFromFile(path);
  EXPECT_FALSE(config.metrics.enabled);
  EXPECT_EQ(config.metrics.path, "/internal/metrics");
}

TEST_F(ConfigTest, LoadFromFile_NonExistent) {
  EXPECT_THROW(Config::LoadFromFile("/nonexistent/taskd.yaml"),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_FlagsOverrideFile) {
  auto path = WriteConfig(
      "server:\n"
      "  port: 8081\n"
      "  host: 10.0.0.1\n"
      "store:\n"
      "  path: /from/file.json\n");

  const char* argv[] = {"taskd_server", "--config", path.c_str(),
                        "--port", "9999"};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 9999);
  EXPECT_EQ(config.server.host, "10.0.0.1");
  EXPECT_EQ(config.store.path, "/from/file.json");
}

TEST_F(ConfigTest, LoadFromArgs_DefaultValuedFlagsOverrideFile) {
  auto path = WriteConfig(
      "server:\n"
      "  port: 8080\n"
      "  log_level: debug\n"
      "store:\n"
      "  backend: memory\n"
      "  path: /from/file.json\n");

  const char* argv[] = {"taskd_server", "--port", "3000", "--log-level", "info",
                        "--backend", "file", "--data-path", "tasks.json",
                        "-c", path.c_str()};
  auto config = Config::LoadFromArgs(11, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 3000);
  EXPECT_EQ(config.server.log_level, "info");
  EXPECT_EQ(config.store.backend, StoreBackend::kFile);
  EXPECT_EQ(config.store.path, "tasks.json");
}

TEST_F(ConfigTest, LoadFromArgs_NoMetricsOverridesFile) {
  auto path = WriteConfig(
      "metrics:\n"
      "  enabled: true\n"
      "  path: /internal/metrics\n");

  const char* argv[] = {"taskd_server", "--no-metrics", "--config", path.c_str()};
  auto config = Config::LoadFromArgs(4, const_cast<char**>(argv));
  EXPECT_FALSE(config.metrics.enabled);
  EXPECT_EQ(config.metrics.path, "/internal/metrics");
}

TEST_F(ConfigTest, Validate_Valid) {
  Config config;
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, Validate_EmptyPath) {
  Config config;
  config.store.path = "";
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config.store.backend = StoreBackend::kMemory;
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, Validate_InvalidPort) {
  Config config;
  config.server.port = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_InvalidLogLevel) {
  Config config;
  config.server.log_level = "verbose";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_MetricsPath) {
  Config config;
  config.metrics.path = "metrics";
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config.metrics.enabled = false;
  EXPECT_NO_THROW(config.Validate());
}

// =============================================================================
// PrometheusMetrics Tests
// =============================================================================

class MetricsTest : public ::testing::Test {
 protected:
  PrometheusMetrics metrics_;
};

TEST_F(MetricsTest, Counter_Increments) {
  metrics_.Counter("taskd_tasks_created_total", 1);
  metrics_.Counter("taskd_tasks_created_total", 2);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("taskd_tasks_created_total 3"), std::string::npos);
}

TEST_F(MetricsTest, Gauge_Overwrite) {
  metrics_.Gauge("taskd_tasks_total", 10.0);
  metrics_.Gauge("taskd_tasks_total", 20.0);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("taskd_tasks_total 20"), std::string::npos);
  EXPECT_EQ(output.find("taskd_tasks_total 10"), std::string::npos);
}

TEST_F(MetricsTest, Histogram_RecordsValues) {
  metrics_.Histogram("test_histogram", 5);
  metrics_.Histogram("test_histogram", 50);
  metrics_.Histogram("test_histogram", 500);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("test_histogram_count 3"), std::string::npos);
  EXPECT_NE(output.find("test_histogram_sum 555"), std::string::npos);
  EXPECT_NE(output.find("test_histogram_bucket{le=\"+Inf\"} 3"), std::string::npos);
}

TEST_F(MetricsTest, Histogram_BoundsAreInclusive) {
  metrics_.Histogram("h", 5);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("h_bucket{le=\"2.5\"} 0\n"), std::string::npos);
  EXPECT_NE(output.find("h_bucket{le=\"5\"} 1\n"), std::string::npos);
  EXPECT_NE(output.find("h_bucket{le=\"10000\"} 1\n"), std::string::npos);
}

TEST_F(MetricsTest, Export_OrdersFamiliesByName) {
  metrics_.Counter("taskd_tasks_updated_total", 1);
  metrics_.Counter("taskd_tasks_created_total", 1);

  std::string output = metrics_.Export();
  EXPECT_LT(output.find("taskd_tasks_created_total"),
            output.find("taskd_tasks_updated_total"));
}

TEST_F(MetricsTest, RecordHttpRequest_LabelsByRoute) {
  metrics_.RecordHttpRequest("PATCH", "/tasks/{id}/status", 200, 1.5);
  metrics_.RecordHttpRequest("PATCH", "/tasks/{id}/status", 200, 2.0);
  metrics_.RecordHttpRequest("PATCH", "/tasks/{id}/status", 404, 0.5);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("taskd_http_requests_total{method=\"PATCH\","
                        "path=\"/tasks/{id}/status\",status=\"200\"} 2"),
            std::string::npos);
  EXPECT_NE(output.find("status=\"404\"} 1"), std::string::npos);
  EXPECT_NE(output.find("taskd_http_request_duration_ms_count 3"),
            std::string::npos);
}

TEST_F(MetricsTest, Export_IncludesTypeAnnotations) {
  metrics_.Counter("my_counter", 1);
  metrics_.Gauge("my_gauge", 1.0);
  metrics_.Histogram("my_histogram", 1);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("# TYPE my_counter counter"), std::string::npos);
  EXPECT_NE(output.find("# TYPE my_gauge gauge"), std::string::npos);
  EXPECT_NE(output.find("# TYPE my_histogram histogram"), std::string::npos);
}

TEST(RouteLabelTest, CollapsesTaskIds) {
  EXPECT_EQ(RouteLabel("/tasks"), "/tasks");
  EXPECT_EQ(RouteLabel("/tasks/"), "/tasks/");
  EXPECT_EQ(RouteLabel("/tasks/3f2a9c1e"), "/tasks/{id}");
  EXPECT_EQ(RouteLabel("/tasks/3f2a9c1e/status"), "/tasks/{id}/status");
  EXPECT_EQ(RouteLabel("/health/ready"), "/health/ready");
}

TEST(RequestTimerTest, RecordsOnDestruction) {
  auto metrics = std::make_shared<PrometheusMetrics>();

  {
    RequestTimer timer(metrics, "DELETE", "/tasks/{id}");
    timer.SetStatusCode(204);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  std::string output = metrics->Export();
  EXPECT_NE(output.find("method=\"DELETE\",path=\"/tasks/{id}\",status=\"204\"} 1"),
            std::string::npos);
  EXPECT_NE(output.find("taskd_http_request_duration_ms_count 1"),
            std::string::npos);
}

// =============================================================================
// Error Mapping Tests
// =============================================================================

TEST(MakeErrorResponseTest, InvalidArgument) {
  auto resp = MakeErrorResponse(rocksdb::Status::InvalidArgument(kInvalidStatus),
                                "Failed to save tasks");
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["error"].asString(), "Invalid status");
}

TEST(MakeErrorResponseTest, NotFound) {
  auto resp = MakeErrorResponse(rocksdb::Status::NotFound(kTaskNotFound),
                                "Failed to save tasks");
  EXPECT_EQ(resp->statusCode(), drogon::k404NotFound);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["error"].asString(), "Task not found");
}

TEST(MakeErrorResponseTest, StorageFailureUsesContext) {
  auto resp = MakeErrorResponse(rocksdb::Status::IOError("disk full"),
                                "Failed to save tasks");
  EXPECT_EQ(resp->statusCode(), drogon::k500InternalServerError);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["error"].asString(), "Failed to save tasks");
}

TEST(ParseJsonBodyTest, AcceptsObjectsAndEmptyBody) {
  auto req = drogon::HttpRequest::newHttpRequest();
  Json::Value body;
  ASSERT_TRUE(ParseJsonBody(req, &body));
  EXPECT_TRUE(body.isObject());
  EXPECT_TRUE(body.empty());

  req->setBody(R"({"description": "write report"})");
  ASSERT_TRUE(ParseJsonBody(req, &body));
  EXPECT_EQ(body["description"].asString(), "write report");
}

TEST(ParseJsonBodyTest, RejectsMalformedAndNonObjects) {
  Json::Value body;

  auto malformed = drogon::HttpRequest::newHttpRequest();
  malformed->setBody("{\"description\": ");
  EXPECT_FALSE(ParseJsonBody(malformed, &body));

  auto array = drogon::HttpRequest::newHttpRequest();
  array->setBody("[1, 2]");
  EXPECT_FALSE(ParseJsonBody(array, &body));
}

// =============================================================================
// ShutdownHandler Tests
// =============================================================================

class CloseTrackingStore : public MemoryStore {
 public:
  explicit CloseTrackingStore(std::vector<std::string>* events)
      : events_(events) {}
  void Close() override { events_->push_back("close"); }

 private:
  std::vector<std::string>* events_;
};

TEST(ShutdownHandlerTest, RunsCallbacksBeforeClosingStores) {
  std::vector<std::string> events;
  CloseTrackingStore store(&events);

  ShutdownHandler handler;
  handler.RegisterStore(&store);
  handler.RegisterStore(&store);  // duplicates are ignored
  handler.OnShutdown([&events]() { events.push_back("callback"); });

  EXPECT_FALSE(handler.IsShutdownRequested());
  EXPECT_TRUE(handler.Shutdown());
  EXPECT_TRUE(handler.IsShutdownRequested());
  EXPECT_EQ(handler.ShutdownSignal(), 0);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], "callback");
  EXPECT_EQ(events[1], "close");

  EXPECT_FALSE(handler.Shutdown());
  EXPECT_EQ(events.size(), 2u);
}

TEST(ShutdownHandlerTest, UnregisteredStoreIsNotClosed) {
  std::vector<std::string> events;
  CloseTrackingStore store(&events);

  ShutdownHandler handler;
  handler.RegisterStore(&store);
  handler.UnregisterStore(&store);
  handler.Shutdown();

  EXPECT_TRUE(events.empty());
}

TEST(ShutdownHandlerTest, OnlyOneHandlerOwnsSignals) {
  ShutdownHandler first;
  ShutdownHandler second;

  ASSERT_TRUE(first.InstallSignalHandlers());
  EXPECT_FALSE(second.InstallSignalHandlers());

  first.RestoreSignalHandlers();
  EXPECT_TRUE(second.InstallSignalHandlers());
  second.RestoreSignalHandlers();
}

// =============================================================================
// End-to-End Server Tests (using Drogon HTTP client)
// =============================================================================

class ServerE2ETest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    temp_dir_ = std::make_unique<TempDir>("taskd_server_test_");

    Config config;
    config.store.path = (temp_dir_->path() / "tasks.json").string();
    auto status = OpenTaskStore(config.store, &store_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    metrics_ = std::make_shared<PrometheusMetrics>();
    ServiceOptions options;
    options.metrics = metrics_;
    service_ = std::make_unique<TaskService>(store_.get(), options);

    RegisterHandlers(service_.get());
    RegisterMetricsHandler(metrics_, service_.get(), config.metrics);

    // Start Drogon on a random port
    port_ = 18080 + (std::random_device{}() % 1000);

    // Capture log lines so request logging can be checked.
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) {
          std::lock_guard<std::mutex> lock(log_mu_);
          log_.append(msg, len);
        },
        []() {});

    drogon::app()
        .setLogLevel(trantor::Logger::kInfo)
        .addListener("127.0.0.1", port_)
        .setThreadNum(1)
        .disableSession();

    server_thread_ = std::thread([]() { drogon::app().run(); });

    // Wait for server to start
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  }

  static void TearDownTestSuite() {
    drogon::app().quit();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    service_.reset();
    store_.reset();
    temp_dir_.reset();
  }

  static std::string BaseUrl() {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  // Sends a request and waits for the response; nullptr on failure.
  static drogon::HttpResponsePtr Send(
      drogon::HttpMethod method, const std::string& path,
      const std::string& body = "",
      const std::string& status_param = "") {
    auto client = drogon::HttpClient::newHttpClient(BaseUrl());
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setPath(path);
    req->setMethod(method);
    if (!status_param.empty()) {
      req->setParameter("status", status_param);
    }
    if (!body.empty()) {
      req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
      req->setBody(body);
    }

    auto promise = std::make_shared<std::promise<drogon::HttpResponsePtr>>();
    auto future = promise->get_future();
    client->sendRequest(
        req,
        [promise](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
          promise->set_value(result == drogon::ReqResult::Ok ? resp : nullptr);
        });

    if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
      return nullptr;
    }
    return future.get();
  }

  static Json::Value JsonOf(const drogon::HttpResponsePtr& resp) {
    auto json = resp->getJsonObject();
    return json ? *json : Json::Value();
  }

  static bool LogContains(const std::string& needle) {
    std::lock_guard<std::mutex> lock(log_mu_);
    return log_.find(needle) != std::string::npos;
  }

  static std::string CreateTask(const std::string& body) {
    auto resp = Send(drogon::Post, "/tasks", body);
    if (!resp || resp->statusCode() != drogon::k201Created) return "";
    return JsonOf(resp)["id"].asString();
  }

  static std::unique_ptr<TempDir> temp_dir_;
  static std::unique_ptr<TaskStore> store_;
  static std::shared_ptr<PrometheusMetrics> metrics_;
  static std::unique_ptr<TaskService> service_;
  static uint16_t port_;
  static std::thread server_thread_;
  static std::mutex log_mu_;
  static std::string log_;
};

std::unique_ptr<TempDir> ServerE2ETest::temp_dir_;
std::unique_ptr<TaskStore> ServerE2ETest::store_;
std::shared_ptr<PrometheusMetrics> ServerE2ETest::metrics_;
std::unique_ptr<TaskService> ServerE2ETest::service_;
uint16_t ServerE2ETest::port_ = 0;
std::thread ServerE2ETest::server_thread_;
std::mutex ServerE2ETest::log_mu_;
std::string ServerE2ETest::log_;

TEST_F(ServerE2ETest, Health_Liveness) {
  auto resp = Send(drogon::Get, "/health");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k200OK);
  EXPECT_EQ(JsonOf(resp)["status"].asString(), "healthy");
}

TEST_F(ServerE2ETest, Health_Readiness) {
  auto resp = Send(drogon::Get, "/health/ready");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k200OK);

  auto json = JsonOf(resp);
  EXPECT_EQ(json["status"].asString(), "healthy");
  EXPECT_EQ(json["backend"].asString(), "file");
  EXPECT_TRUE(json.isMember("total_tasks"));
  EXPECT_TRUE(json["tasks_by_status"].isMember("in-progress"));
}

TEST_F(ServerE2ETest, Tasks_Lifecycle) {
  // Create
  auto resp = Send(drogon::Post, "/tasks", R"({"description": "write report"})");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k201Created);
  auto created = JsonOf(resp);
  EXPECT_EQ(created["description"].asString(), "write report");
  EXPECT_EQ(created["status"].asString(), "todo");
  EXPECT_EQ(created["createdAt"].asString(), created["updatedAt"].asString());
  std::string id = created["id"].asString();
  ASSERT_FALSE(id.empty());

  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  // Patch status
  resp = Send(drogon::Patch, "/tasks/" + id + "/status", R"({"status": "done"})");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);
  auto patched = JsonOf(resp);
  EXPECT_EQ(patched["status"].asString(), "done");
  EXPECT_GT(patched["updatedAt"].asString(), created["updatedAt"].asString());

  // Filter
  resp = Send(drogon::Get, "/tasks", "", "done");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);
  auto done = JsonOf(resp);
  ASSERT_TRUE(done.isArray());
  bool found = false;
  for (const auto& task : done) {
    EXPECT_EQ(task["status"].asString(), "done");
    if (task["id"].asString() == id) found = true;
  }
  EXPECT_TRUE(found);

  // Delete
  resp = Send(drogon::Delete, "/tasks/" + id);
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k204NoContent);
  EXPECT_TRUE(resp->body().empty());

  // Gone
  resp = Send(drogon::Put, "/tasks/" + id, "{}");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k404NotFound);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Task not found");
}

TEST_F(ServerE2ETest, Tasks_FullUpdate) {
  std::string id = CreateTask(R"({"description": "draft", "status": "in-progress"})");
  ASSERT_FALSE(id.empty());

  auto resp = Send(drogon::Put, "/tasks/" + id, R"({"description": "final"})");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);
  auto json = JsonOf(resp);
  EXPECT_EQ(json["description"].asString(), "final");
  EXPECT_EQ(json["status"].asString(), "in-progress");

  resp = Send(drogon::Put, "/tasks/" + id, R"({"status": "paused"})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Invalid status");
}

TEST_F(ServerE2ETest, Tasks_ValidationErrors) {
  auto resp = Send(drogon::Post, "/tasks", "{}");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Description is required");

  resp = Send(drogon::Post, "/tasks", R"({"description": ""})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);

  resp = Send(drogon::Get, "/tasks", "", "bogus");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Invalid status filter");

  resp = Send(drogon::Post, "/tasks", "{\"description\": ");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Malformed JSON body");
}

TEST_F(ServerE2ETest, Tasks_PatchValidatesBeforeLookup) {
  std::string id = CreateTask(R"({"description": "a"})");
  ASSERT_FALSE(id.empty());

  auto resp = Send(drogon::Patch, "/tasks/" + id + "/status", R"({"status": 3})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
  EXPECT_EQ(JsonOf(resp)["error"].asString(), "Invalid status");

  resp = Send(drogon::Patch, "/tasks/no-such-id/status", R"({"status": "bogus"})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);

  resp = Send(drogon::Patch, "/tasks/no-such-id/status", R"({"status": "done"})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k404NotFound);

  resp = Send(drogon::Delete, "/tasks/no-such-id");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k404NotFound);
}

TEST_F(ServerE2ETest, Tasks_ListPreservesInsertionOrder) {
  std::string first = CreateTask(R"({"description": "first"})");
  std::string second = CreateTask(R"({"description": "second"})");
  ASSERT_FALSE(first.empty());
  ASSERT_FALSE(second.empty());

  auto resp = Send(drogon::Get, "/tasks");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);

  auto tasks = JsonOf(resp);
  ASSERT_TRUE(tasks.isArray());
  int first_pos = -1, second_pos = -1;
  for (Json::ArrayIndex i = 0; i < tasks.size(); ++i) {
    if (tasks[i]["id"].asString() == first) first_pos = static_cast<int>(i);
    if (tasks[i]["id"].asString() == second) second_pos = static_cast<int>(i);
  }
  ASSERT_GE(first_pos, 0);
  EXPECT_EQ(second_pos, first_pos + 1);
}

TEST_F(ServerE2ETest, Logging_IncludesUnroutedRequests) {
  auto resp = Send(drogon::Get, "/nope");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k404NotFound);

  resp = Send(drogon::Patch, "/tasks", R"({"description": "no route"})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_GE(static_cast<int>(resp->statusCode()), 400);

  EXPECT_TRUE(LogContains("Incoming request: GET /nope"));
  EXPECT_TRUE(LogContains("Incoming request: PATCH /tasks"));
  EXPECT_TRUE(LogContains(R"(Body: {"description": "no route"})"));
}

TEST_F(ServerE2ETest, Logging_IncludesQueryString) {
  auto resp = Send(drogon::Get, "/tasks", "", "todo");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k200OK);
  EXPECT_TRUE(LogContains("Incoming request: GET /tasks?status=todo"));
}

TEST_F(ServerE2ETest, Metrics_Endpoint) {
  ASSERT_FALSE(CreateTask(R"({"description": "counted"})").empty());

  auto resp = Send(drogon::Get, "/metrics");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);

  std::string body(resp->body());
  EXPECT_NE(body.find("taskd_tasks_created_total"), std::string::npos);
  EXPECT_NE(body.find("taskd_tasks_total"), std::string::npos);
  EXPECT_NE(body.find("method=\"POST\",path=\"/tasks\",status=\"201\""),
            std::string::npos);
}

}  // namespace
}  // namespace taskd::server
