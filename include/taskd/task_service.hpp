#pragma once

#include <taskd/clock.hpp>
#include <taskd/store.hpp>
#include <taskd/task.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace taskd {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., tasks created, save failures). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, sizes in bytes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values. Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

// Error messages returned to HTTP clients verbatim.
inline constexpr const char* kDescriptionRequired = "Description is required";
inline constexpr const char* kInvalidStatus = "Invalid status";
inline constexpr const char* kInvalidStatusFilter = "Invalid status filter";
inline constexpr const char* kTaskNotFound = "Task not found";

struct ServiceOptions {
  // Hold a single writer mutex across each mutating read-modify-write cycle.
  // Off by default: concurrent writers may then lose updates.
  bool serialize_writes = false;

  // Optional; counters are emitted for mutations and save failures.
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * Caller-supplied task fields for create and full update.
 * Unset fields are "not provided".
 */
struct TaskFields {
  std::optional<std::string> description;
  std::optional<std::string> status;
};

/**
 * Task operations on top of a TaskStore.
 *
 * Each operation loads the full collection, applies its change and saves the
 * full collection back. Errors are reported as:
 *   InvalidArgument  - validation failure, message suitable for clients
 *   NotFound         - unknown task id
 *   IOError (etc.)   - the store failed to save; nothing was persisted
 */
class TaskService {
 public:
  /**
   * store must outlive the service. clock defaults to the system clock.
   */
  explicit TaskService(TaskStore* store,
                       ServiceOptions options = ServiceOptions(),
                       const Clock* clock = nullptr);

  TaskService(const TaskService&) = delete;
  TaskService& operator=(const TaskService&) = delete;

  /**
   * Create a task. description must be a non-empty string; status defaults
   * to "todo" and must be in the enumeration when given.
   */
  rocksdb::Status Create(const TaskFields& fields, Task* out);

  /**
   * List tasks in stored order. An empty filter returns everything; any
   * other filter must name a status.
   */
  rocksdb::Status List(std::string_view status_filter, std::vector<Task>* out);

  /**
   * Overwrite the provided fields of an existing task. An empty description
   * is treated as not provided. A provided status is validated before the
   * task is looked up.
   */
  rocksdb::Status Update(const std::string& id, const TaskFields& fields,
                         Task* out);

  /** Set only the status. Validation precedes the existence check. */
  rocksdb::Status UpdateStatus(const std::string& id, std::string_view status,
                               Task* out);

  rocksdb::Status Delete(const std::string& id);

  TaskStore* store() const { return store_; }

 private:
  std::string Now() const;

  // Refresh updated_at, never letting it precede created_at.
  void Touch(Task* task) const;

  rocksdb::Status SaveAll(const std::vector<Task>& tasks);

  void EmitCounter(std::string_view name) const {
    if (options_.metrics) options_.metrics->Counter(name, 1);
  }

  TaskStore* store_;
  ServiceOptions options_;
  const Clock* clock_;
  std::mutex write_mu_;
};

}  // namespace taskd
