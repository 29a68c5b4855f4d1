#pragma once

#include <taskd/store.hpp>
#include <taskd/task_service.hpp>

#include <cstdint>
#include <string>

namespace taskd::server {

/**
 * Server configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 3000;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  StoreOptions store;
  ServiceOptions service;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace taskd::server
