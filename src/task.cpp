#include <taskd/task.hpp>

#include <memory>
#include <utility>

namespace taskd {

namespace {

constexpr const char* kTodo = "todo";
constexpr const char* kInProgress = "in-progress";
constexpr const char* kDone = "done";

rocksdb::Status ReadStringField(const Json::Value& json, const char* name,
                                std::string* out) {
  const Json::Value& v = json[name];
  if (!v.isString()) {
    return rocksdb::Status::Corruption("task field is missing or not a string",
                                       name);
  }
  *out = v.asString();
  return rocksdb::Status::OK();
}

}  // namespace

const char* ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kTodo:
      return kTodo;
    case TaskStatus::kInProgress:
      return kInProgress;
    case TaskStatus::kDone:
      return kDone;
  }
  return kTodo;
}

bool ParseTaskStatus(std::string_view name, TaskStatus* out) {
  if (name == kTodo) {
    *out = TaskStatus::kTodo;
  } else if (name == kInProgress) {
    *out = TaskStatus::kInProgress;
  } else if (name == kDone) {
    *out = TaskStatus::kDone;
  } else {
    return false;
  }
  return true;
}

bool operator==(const Task& a, const Task& b) {
  return a.id == b.id && a.description == b.description &&
         a.status == b.status && a.created_at == b.created_at &&
         a.updated_at == b.updated_at;
}

// --- Codec ---

Json::Value TaskToJson(const Task& task) {
  Json::Value json(Json::objectValue);
  json["id"] = task.id;
  json["description"] = task.description;
  json["status"] = ToString(task.status);
  json["createdAt"] = task.created_at;
  json["updatedAt"] = task.updated_at;
  return json;
}

Json::Value TasksToJson(const std::vector<Task>& tasks) {
  Json::Value json(Json::arrayValue);
  for (const auto& task : tasks) {
    json.append(TaskToJson(task));
  }
  return json;
}

rocksdb::Status TaskFromJson(const Json::Value& json, Task* out) {
  if (!json.isObject()) {
    return rocksdb::Status::Corruption("task entry is not an object");
  }

  Task task;
  std::string status_name;

  auto s = ReadStringField(json, "id", &task.id);
  if (s.ok()) s = ReadStringField(json, "description", &task.description);
  if (s.ok()) s = ReadStringField(json, "status", &status_name);
  if (s.ok()) s = ReadStringField(json, "createdAt", &task.created_at);
  if (s.ok()) s = ReadStringField(json, "updatedAt", &task.updated_at);
  if (!s.ok()) return s;

  if (!ParseTaskStatus(status_name, &task.status)) {
    return rocksdb::Status::Corruption("unknown task status", status_name);
  }

  *out = std::move(task);
  return rocksdb::Status::OK();
}

std::string SerializeTasks(const std::vector<Task>& tasks) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, TasksToJson(tasks));
}

rocksdb::Status ParseTasks(std::string_view text, std::vector<Task>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return rocksdb::Status::Corruption("task collection is not valid JSON",
                                       errors);
  }
  if (!root.isArray()) {
    return rocksdb::Status::Corruption("task collection is not a JSON array");
  }

  std::vector<Task> tasks;
  tasks.reserve(root.size());
  for (const auto& entry : root) {
    Task task;
    auto s = TaskFromJson(entry, &task);
    if (!s.ok()) return s;
    tasks.push_back(std::move(task));
  }

  *out = std::move(tasks);
  return rocksdb::Status::OK();
}

}  // namespace taskd
