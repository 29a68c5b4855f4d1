#pragma once

#include <taskd/server/config.hpp>
#include <taskd/server/metrics.hpp>
#include <taskd/store.hpp>
#include <taskd/task_service.hpp>

#include <memory>
#include <string>

namespace taskd::server {

/**
 * taskd HTTP Server.
 *
 * Opens the configured TaskStore and serves the task REST API over it
 * using Drogon, along with health and metrics endpoints.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid or the store
   *         cannot be opened.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   * The event loop is stopped, then the store is closed.
   */
  void Shutdown();

  TaskService* GetService() { return service_.get(); }
  TaskStore* GetStore() { return store_.get(); }

 private:
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  std::unique_ptr<TaskStore> store_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<TaskService> service_;
  bool running_ = false;
};

}  // namespace taskd::server
