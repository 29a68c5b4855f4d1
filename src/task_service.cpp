#include <taskd/task_service.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <utility>

namespace taskd {

namespace {

std::unique_lock<std::mutex> MaybeLock(std::mutex& mu, bool enabled) {
  return enabled ? std::unique_lock<std::mutex>(mu)
                 : std::unique_lock<std::mutex>(mu, std::defer_lock);
}

std::vector<Task>::iterator FindTask(std::vector<Task>& tasks,
                                     const std::string& id) {
  return std::find_if(tasks.begin(), tasks.end(),
                      [&id](const Task& t) { return t.id == id; });
}

}  // namespace

TaskService::TaskService(TaskStore* store, ServiceOptions options,
                         const Clock* clock)
    : store_(store),
      options_(std::move(options)),
      clock_(clock ? clock : DefaultClock()) {}

std::string TaskService::Now() const {
  return internal::FormatIso8601(clock_->WallClockMicros());
}

void TaskService::Touch(Task* task) const {
  std::string now = Now();
  task->updated_at = now < task->created_at ? task->created_at : now;
}

rocksdb::Status TaskService::SaveAll(const std::vector<Task>& tasks) {
  auto s = store_->Save(tasks);
  if (!s.ok()) {
    EmitCounter("taskd_store_save_failures_total");
    LOG_ERROR << "Failed to save tasks: " << s.ToString();
  }
  return s;
}

rocksdb::Status TaskService::Create(const TaskFields& fields, Task* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  if (!fields.description || fields.description->empty()) {
    return rocksdb::Status::InvalidArgument(kDescriptionRequired);
  }

  Task task;
  if (fields.status && !ParseTaskStatus(*fields.status, &task.status)) {
    return rocksdb::Status::InvalidArgument(kInvalidStatus);
  }
  task.id = internal::NewTaskId();
  task.description = *fields.description;
  task.created_at = Now();
  task.updated_at = task.created_at;

  auto lock = MaybeLock(write_mu_, options_.serialize_writes);
  auto tasks = store_->Load();
  while (FindTask(tasks, task.id) != tasks.end()) {
    task.id = internal::NewTaskId();
  }
  tasks.push_back(task);

  auto s = SaveAll(tasks);
  if (!s.ok()) return s;

  EmitCounter("taskd_tasks_created_total");
  LOG_INFO << "Created task " << task.id << " (" << ToString(task.status)
           << "): " << task.description;
  *out = std::move(task);
  return rocksdb::Status::OK();
}

rocksdb::Status TaskService::List(std::string_view status_filter,
                                  std::vector<Task>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  if (status_filter.empty()) {
    *out = store_->Load();
    return rocksdb::Status::OK();
  }

  TaskStatus wanted = TaskStatus::kTodo;
  if (!ParseTaskStatus(status_filter, &wanted)) {
    return rocksdb::Status::InvalidArgument(kInvalidStatusFilter);
  }

  auto tasks = store_->Load();
  tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                             [wanted](const Task& t) { return t.status != wanted; }),
              tasks.end());
  *out = std::move(tasks);
  return rocksdb::Status::OK();
}

rocksdb::Status TaskService::Update(const std::string& id,
                                    const TaskFields& fields, Task* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  TaskStatus new_status = TaskStatus::kTodo;
  if (fields.status && !ParseTaskStatus(*fields.status, &new_status)) {
    return rocksdb::Status::InvalidArgument(kInvalidStatus);
  }

  auto lock = MaybeLock(write_mu_, options_.serialize_writes);
  auto tasks = store_->Load();
  auto it = FindTask(tasks, id);
  if (it == tasks.end()) {
    return rocksdb::Status::NotFound(kTaskNotFound);
  }

  if (fields.description && !fields.description->empty()) {
    it->description = *fields.description;
  }
  if (fields.status) {
    it->status = new_status;
  }
  Touch(&*it);

  auto s = SaveAll(tasks);
  if (!s.ok()) return s;

  EmitCounter("taskd_tasks_updated_total");
  LOG_INFO << "Updated task " << it->id << " (" << ToString(it->status)
           << "): " << it->description;
  *out = *it;
  return rocksdb::Status::OK();
}

rocksdb::Status TaskService::UpdateStatus(const std::string& id,
                                          std::string_view status, Task* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  TaskStatus new_status = TaskStatus::kTodo;
  if (!ParseTaskStatus(status, &new_status)) {
    return rocksdb::Status::InvalidArgument(kInvalidStatus);
  }

  auto lock = MaybeLock(write_mu_, options_.serialize_writes);
  auto tasks = store_->Load();
  auto it = FindTask(tasks, id);
  if (it == tasks.end()) {
    return rocksdb::Status::NotFound(kTaskNotFound);
  }

  it->status = new_status;
  Touch(&*it);

  auto s = SaveAll(tasks);
  if (!s.ok()) return s;

  EmitCounter("taskd_tasks_updated_total");
  LOG_INFO << "Patched task " << id << " to status " << ToString(new_status);
  *out = *it;
  return rocksdb::Status::OK();
}

rocksdb::Status TaskService::Delete(const std::string& id) {
  auto lock = MaybeLock(write_mu_, options_.serialize_writes);
  auto tasks = store_->Load();
  auto it = FindTask(tasks, id);
  if (it == tasks.end()) {
    return rocksdb::Status::NotFound(kTaskNotFound);
  }

  tasks.erase(it);

  auto s = SaveAll(tasks);
  if (!s.ok()) return s;

  EmitCounter("taskd_tasks_deleted_total");
  LOG_INFO << "Deleted task " << id;
  return rocksdb::Status::OK();
}

}  // namespace taskd
