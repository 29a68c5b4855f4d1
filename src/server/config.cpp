#include <taskd/server/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace taskd::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 3000)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --data-path <path>        Task file or database path (default: tasks.json)\n"
            << "  --backend <name>          Store backend: file, rocksdb, memory\n"
            << "  --serialize-writes        Serialize mutating requests\n"
            << "  --no-metrics              Disable the metrics endpoint\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --data-path /var/lib/taskd/tasks.json --port 3000\n"
            << "  " << argv0 << " --backend rocksdb --data-path /var/lib/taskd/db\n"
            << "  " << argv0 << " --config /etc/taskd/server.yaml\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint64_t ParseUnsigned(const std::string& value, const std::string& what,
                       uint64_t max) {
  size_t pos = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &pos);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
  if (pos != value.size() || parsed > max) {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
  return parsed;
}

uint16_t ParsePort(const std::string& value) {
  return static_cast<uint16_t>(ParseUnsigned(value, "port", 65535));
}

uint32_t ParseThreads(const std::string& value) {
  return static_cast<uint32_t>(ParseUnsigned(value, "thread count", 1024));
}

StoreBackend ParseBackend(const std::string& value) {
  StoreBackend backend = StoreBackend::kFile;
  if (!ParseStoreBackend(value, &backend)) {
    throw std::runtime_error("Invalid store backend: " + value +
                             " (must be file, rocksdb, or memory)");
  }
  return backend;
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = ParsePort(value);
      } else if (key == "threads") {
        config.server.threads = ParseThreads(value);
      } else if (key == "log_level") {
        config.server.log_level = value;
      }
    } else if (current_section == "store") {
      if (key == "path") {
        config.store.path = value;
      } else if (key == "backend") {
        config.store.backend = ParseBackend(value);
      } else if (key == "sync") {
        config.store.sync = ParseBool(value);
      }
    } else if (current_section == "service") {
      if (key == "serialize_writes") {
        config.service.serialize_writes = ParseBool(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "data_path") {
        config.store.path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is located first and becomes the base, so every flag
  // given on the command line wins over it, including flags whose value
  // happens to equal the built-in default.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    }
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[++i];
    }
  }

  Config config = config_file.empty() ? Config() : LoadFromFile(config_file);

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "-c") {
      ++i;  // consumed above
    } else if (arg == "--host") {
      if (++i >= argc) {
        throw std::runtime_error("--host requires an address argument");
      }
      config.server.host = argv[i];
    } else if (arg == "--port" || arg == "-p") {
      if (++i >= argc) {
        throw std::runtime_error("--port requires a port number");
      }
      config.server.port = ParsePort(argv[i]);
    } else if (arg == "--threads") {
      if (++i >= argc) {
        throw std::runtime_error("--threads requires a number");
      }
      config.server.threads = ParseThreads(argv[i]);
    } else if (arg == "--data-path") {
      if (++i >= argc) {
        throw std::runtime_error("--data-path requires a path");
      }
      config.store.path = argv[i];
    } else if (arg == "--backend") {
      if (++i >= argc) {
        throw std::runtime_error("--backend requires a backend name");
      }
      config.store.backend = ParseBackend(argv[i]);
    } else if (arg == "--serialize-writes") {
      config.service.serialize_writes = true;
    } else if (arg == "--no-metrics") {
      config.metrics.enabled = false;
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        throw std::runtime_error("--log-level requires a level");
      }
      config.server.log_level = argv[i];
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (store.backend != StoreBackend::kMemory && store.path.empty()) {
    throw std::runtime_error("store path is required (use --data-path or config file)");
  }

  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }
}

}  // namespace taskd::server
