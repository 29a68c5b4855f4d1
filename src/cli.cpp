#include <taskd/cli.hpp>
#include <taskd/store.hpp>
#include <taskd/task_service.hpp>

#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

namespace taskd {

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void Usage(const char* argv0, std::ostream& err) {
  err << "usage:\n"
      << "  " << argv0 << " <data_path> [--backend file|rocksdb] list [status]\n"
      << "  " << argv0 << " <data_path> [--backend file|rocksdb] add <description> [status]\n"
      << "  " << argv0 << " <data_path> [--backend file|rocksdb] status <id> <status>\n"
      << "  " << argv0 << " <data_path> [--backend file|rocksdb] update <id> <description>\n"
      << "  " << argv0 << " <data_path> [--backend file|rocksdb] del <id>\n";
}

void Print(const Json::Value& json, std::ostream& out) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  out << Json::writeString(builder, json) << "\n";
}

int Fail(const char* what, const rocksdb::Status& s, std::ostream& err) {
  const char* state = s.getState();
  err << what << " failed: " << (state ? state : s.ToString()) << "\n";
  return kExitFailure;
}

}  // namespace

int RunCli(int argc, char** argv, std::ostream& out, std::ostream& err) {
  const char* argv0 = argc > 0 ? argv[0] : "taskd_cli";
  if (argc < 3) {
    Usage(argv0, err);
    return kExitUsage;
  }

  StoreOptions opt;
  opt.path = argv[1];

  int arg = 2;
  if (std::string(argv[arg]) == "--backend") {
    if (argc < arg + 3) {
      Usage(argv0, err);
      return kExitUsage;
    }
    // The memory backend would discard every change on exit.
    if (!ParseStoreBackend(argv[arg + 1], &opt.backend) ||
        opt.backend == StoreBackend::kMemory) {
      err << "unsupported backend: " << argv[arg + 1] << "\n";
      return kExitUsage;
    }
    arg += 2;
  }

  const std::string cmd = argv[arg];
  const int nargs = argc - arg - 1;

  bool arity_ok = false;
  if (cmd == "list") {
    arity_ok = nargs <= 1;
  } else if (cmd == "add") {
    arity_ok = nargs == 1 || nargs == 2;
  } else if (cmd == "status" || cmd == "update") {
    arity_ok = nargs == 2;
  } else if (cmd == "del") {
    arity_ok = nargs == 1;
  }
  if (!arity_ok) {
    Usage(argv0, err);
    return kExitUsage;
  }

  std::unique_ptr<TaskStore> store;
  auto s = OpenTaskStore(opt, &store);
  if (!s.ok()) {
    err << "Open failed: " << s.ToString() << "\n";
    return kExitFailure;
  }
  TaskService service(store.get());

  if (cmd == "list") {
    std::vector<Task> tasks;
    s = service.List(nargs == 1 ? argv[arg + 1] : "", &tasks);
    if (!s.ok()) return Fail("List", s, err);
    Print(TasksToJson(tasks), out);
  } else if (cmd == "add") {
    TaskFields fields;
    fields.description = argv[arg + 1];
    if (nargs == 2) fields.status = argv[arg + 2];
    Task task;
    s = service.Create(fields, &task);
    if (!s.ok()) return Fail("Create", s, err);
    Print(TaskToJson(task), out);
  } else if (cmd == "status") {
    Task task;
    s = service.UpdateStatus(argv[arg + 1], argv[arg + 2], &task);
    if (!s.ok()) return Fail("Status update", s, err);
    Print(TaskToJson(task), out);
  } else if (cmd == "update") {
    TaskFields fields;
    fields.description = argv[arg + 2];
    Task task;
    s = service.Update(argv[arg + 1], fields, &task);
    if (!s.ok()) return Fail("Update", s, err);
    Print(TaskToJson(task), out);
  } else {
    s = service.Delete(argv[arg + 1]);
    if (!s.ok()) return Fail("Delete", s, err);
    out << "OK\n";
  }
  return 0;
}

}  // namespace taskd
