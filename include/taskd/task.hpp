#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>

namespace taskd {

/** Lifecycle state of a task. Any state may follow any other. */
enum class TaskStatus {
  kTodo,
  kInProgress,
  kDone
};

/** Wire name of a status: "todo", "in-progress" or "done". */
const char* ToString(TaskStatus status);

/**
 * Parse a wire status name.
 * Returns false (leaving *out untouched) for anything outside the enumeration.
 */
bool ParseTaskStatus(std::string_view name, TaskStatus* out);

/** The single record type tracked by the service. */
struct Task {
  std::string id;
  std::string description;
  TaskStatus status = TaskStatus::kTodo;
  std::string created_at;  // ISO-8601 UTC, fixed at creation
  std::string updated_at;  // ISO-8601 UTC, refreshed on every mutation
};

bool operator==(const Task& a, const Task& b);
inline bool operator!=(const Task& a, const Task& b) { return !(a == b); }

// ---------------------------------------------------------------------------
// JSON codec
//
// Wire and on-disk shape:
//   {"id": "...", "description": "...", "status": "todo",
//    "createdAt": "...", "updatedAt": "..."}
// ---------------------------------------------------------------------------

Json::Value TaskToJson(const Task& task);
Json::Value TasksToJson(const std::vector<Task>& tasks);

/**
 * Decode one task object.
 * Returns Corruption if a field is missing, not a string, or the status is
 * outside the enumeration.
 */
rocksdb::Status TaskFromJson(const Json::Value& json, Task* out);

/** Pretty-printed (2-space indented) JSON array of tasks. */
std::string SerializeTasks(const std::vector<Task>& tasks);

/**
 * Parse a serialized collection.
 * Returns Corruption if the text is not a JSON array of valid task objects.
 */
rocksdb::Status ParseTasks(std::string_view text, std::vector<Task>* out);

}  // namespace taskd
