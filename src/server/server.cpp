#include <taskd/server/server.hpp>
#include <taskd/server/handlers.hpp>
#include <taskd/shutdown.hpp>
#include <taskd/version.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <iostream>
#include <stdexcept>
#include <thread>

namespace taskd::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  // Validate configuration
  config_.Validate();

  auto status = OpenTaskStore(config_.store, &store_);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open " +
                             std::string(ToString(config_.store.backend)) +
                             " store at " + config_.store.path + ": " +
                             status.ToString());
  }

  // Metrics are wired into the service before it is constructed so that
  // mutation counters reach the same sink the endpoint exports.
  ServiceOptions service_options = config_.service;
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
    service_options.metrics = metrics_;
  }

  service_ = std::make_unique<TaskService>(store_.get(), service_options);
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
  GlobalShutdownHandler().UnregisterStore(store_.get());
}

void Server::SetupRoutes() {
  RegisterHandlers(service_.get());

  if (metrics_) {
    RegisterMetricsHandler(metrics_, service_.get(), config_.metrics);
  }
}

void Server::SetupShutdown() {
  GlobalShutdownHandler().RegisterStore(store_.get());
  if (!GlobalShutdownHandler().InstallSignalHandlers()) {
    LOG_WARN << "Could not install signal handlers; relying on Drogon defaults";
  }

  GlobalShutdownHandler().OnShutdown([]() {
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();

  app.setLogLevel(ToLogLevel(config_.server.log_level));
  app.addListener(config_.server.host, config_.server.port);

  // Set number of threads
  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  app.setIdleConnectionTimeout(60);
  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  std::cout << "taskd " << Version() << " listening on "
            << config_.server.host << ":" << config_.server.port << " with "
            << threads << " threads (" << ToString(config_.store.backend)
            << " store at " << config_.store.path << ")" << std::endl;

  if (config_.service.serialize_writes) {
    std::cout << "Mutating requests are serialized" << std::endl;
  }

  // Run Drogon (blocking)
  app.run();

  // Closes the store if the loop exited without a signal.
  GlobalShutdownHandler().Shutdown();

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace taskd::server
