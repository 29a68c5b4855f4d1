#include <taskd/store.hpp>

#include <trantor/utils/Logger.h>

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace taskd {

namespace {

rocksdb::Status ErrnoStatus(const std::string& context, int err) {
  return rocksdb::Status::IOError(context, std::strerror(err));
}

// Writes data to an open descriptor in full, optionally fsyncing, then
// closes it. The descriptor is closed on every path.
rocksdb::Status WriteAndClose(int fd, const std::string& path,
                              const std::string& data, bool sync) {
  const char* p = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      ::close(fd);
      return ErrnoStatus("write " + path, err);
    }
    p += n;
    remaining -= static_cast<size_t>(n);
  }

  if (sync && ::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    return ErrnoStatus("fsync " + path, err);
  }

  if (::close(fd) != 0) {
    return ErrnoStatus("close " + path, errno);
  }
  return rocksdb::Status::OK();
}

}  // namespace

const char* ToString(StoreBackend backend) {
  switch (backend) {
    case StoreBackend::kFile:
      return "file";
    case StoreBackend::kRocksDB:
      return "rocksdb";
    case StoreBackend::kMemory:
      return "memory";
  }
  return "file";
}

bool ParseStoreBackend(const std::string& name, StoreBackend* out) {
  if (name == "file") {
    *out = StoreBackend::kFile;
  } else if (name == "rocksdb") {
    *out = StoreBackend::kRocksDB;
  } else if (name == "memory") {
    *out = StoreBackend::kMemory;
  } else {
    return false;
  }
  return true;
}

// --- TaskStore ---

std::vector<Task> TaskStore::Load() {
  std::vector<Task> tasks;
  auto s = Read(&tasks);
  if (!s.ok()) {
    // A failed read is reported as an empty collection. The next Save from a
    // caller will replace whatever was on the medium.
    LOG_WARN << "Failed to load tasks (" << ToString(backend())
             << " store), continuing with an empty collection: "
             << s.ToString();
    return {};
  }
  return tasks;
}

rocksdb::Status OpenTaskStore(const StoreOptions& opt,
                              std::unique_ptr<TaskStore>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  switch (opt.backend) {
    case StoreBackend::kFile:
      return JsonFileStore::Open(opt, out);
    case StoreBackend::kRocksDB:
      return RocksDbStore::Open(opt, out);
    case StoreBackend::kMemory:
      *out = std::make_unique<MemoryStore>();
      return rocksdb::Status::OK();
  }
  return rocksdb::Status::InvalidArgument("unknown store backend");
}

// --- JsonFileStore ---

rocksdb::Status JsonFileStore::Open(const StoreOptions& opt,
                                    std::unique_ptr<TaskStore>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.path.empty()) {
    return rocksdb::Status::InvalidArgument("task file path is empty");
  }

  auto store = std::unique_ptr<JsonFileStore>(new JsonFileStore(opt.path, opt.sync));

  std::error_code ec;
  if (!std::filesystem::exists(opt.path, ec)) {
    if (ec) {
      return rocksdb::Status::IOError("stat " + opt.path, ec.message());
    }
    auto parent = std::filesystem::path(opt.path).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        return rocksdb::Status::IOError("create directory " + parent.string(),
                                        ec.message());
      }
    }

    auto s = store->Save({});
    if (!s.ok()) return s;
    LOG_INFO << "Initialized empty task file at " << opt.path;
  }

  *out = std::move(store);
  return rocksdb::Status::OK();
}

rocksdb::Status JsonFileStore::Read(std::vector<Task>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::ifstream file(path_, std::ios::binary);
  if (!file.is_open()) {
    return ErrnoStatus("open " + path_, errno);
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    return rocksdb::Status::IOError("read " + path_);
  }

  return ParseTasks(contents.str(), out);
}

rocksdb::Status JsonFileStore::Save(const std::vector<Task>& tasks) {
  // Each save writes its own sibling file and renames it over the target, so
  // concurrent saves never share a temporary and readers see either the old
  // collection or a new one, never a prefix.
  std::string tmp_path = path_ + ".XXXXXX";
  int fd = ::mkstemp(&tmp_path[0]);
  if (fd < 0) {
    return ErrnoStatus("mkstemp " + tmp_path, errno);
  }
  // mkstemp creates 0600; match what a plain create would give.
  if (::fchmod(fd, 0644) != 0) {
    int err = errno;
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return ErrnoStatus("chmod " + tmp_path, err);
  }

  auto s = WriteAndClose(fd, tmp_path, SerializeTasks(tasks), sync_);
  if (!s.ok()) {
    ::unlink(tmp_path.c_str());
    return s;
  }

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    int err = errno;
    ::unlink(tmp_path.c_str());
    return ErrnoStatus("rename " + tmp_path + " to " + path_, err);
  }
  return rocksdb::Status::OK();
}

// --- MemoryStore ---

rocksdb::Status MemoryStore::Read(std::vector<Task>* out) {
  std::string snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot = serialized_;
  }
  return ParseTasks(snapshot, out);
}

rocksdb::Status MemoryStore::Save(const std::vector<Task>& tasks) {
  std::string serialized = SerializeTasks(tasks);
  std::lock_guard<std::mutex> lock(mu_);
  serialized_ = std::move(serialized);
  return rocksdb::Status::OK();
}

}  // namespace taskd
