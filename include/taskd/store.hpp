#pragma once

#include <taskd/task.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <rocksdb/db.h>
#include <rocksdb/status.h>

namespace taskd {

/** Durable medium backing a TaskStore. */
enum class StoreBackend {
  kFile,     // Single pretty-printed JSON file (default)
  kRocksDB,  // Serialized collection under one key of an embedded RocksDB
  kMemory    // Process-local; nothing survives a restart
};

const char* ToString(StoreBackend backend);
bool ParseStoreBackend(const std::string& name, StoreBackend* out);

struct StoreOptions {
  StoreBackend backend = StoreBackend::kFile;

  // JSON file path (kFile) or database directory (kRocksDB).
  std::string path = "tasks.json";

  // fsync the file / sync the WAL on every save.
  bool sync = true;
};

/**
 * Owns read/write access to the persisted task collection.
 *
 * Every operation reads or rewrites the whole collection; nothing is cached
 * between calls. A single Read or Save is atomic, but nothing spans a
 * caller's read-modify-write cycle, so concurrent writers can lose updates.
 */
class TaskStore {
 public:
  virtual ~TaskStore() = default;

  /**
   * Read the full collection, degrading to an empty collection on any read
   * or parse failure. The failure is logged, not returned.
   */
  std::vector<Task> Load();

  /**
   * Strict read: IOError if the medium cannot be read, Corruption if its
   * contents do not parse.
   */
  virtual rocksdb::Status Read(std::vector<Task>* out) = 0;

  /**
   * Serialize and overwrite the full collection. All-or-nothing: on failure
   * the previously saved collection is left intact.
   */
  virtual rocksdb::Status Save(const std::vector<Task>& tasks) = 0;

  /** Release resources. Safe to call multiple times. */
  virtual void Close() {}

  virtual StoreBackend backend() const = 0;
};

/**
 * Open the backend named by opt.backend, initializing an empty collection if
 * none exists yet.
 */
rocksdb::Status OpenTaskStore(const StoreOptions& opt,
                              std::unique_ptr<TaskStore>* out);

// ---------------------------------------------------------------------------
// Backends
// ---------------------------------------------------------------------------

class JsonFileStore : public TaskStore {
 public:
  static rocksdb::Status Open(const StoreOptions& opt,
                              std::unique_ptr<TaskStore>* out);

  rocksdb::Status Read(std::vector<Task>* out) override;
  rocksdb::Status Save(const std::vector<Task>& tasks) override;
  StoreBackend backend() const override { return StoreBackend::kFile; }

  const std::string& path() const { return path_; }

 private:
  JsonFileStore(std::string path, bool sync)
      : path_(std::move(path)), sync_(sync) {}

  std::string path_;
  bool sync_;
};

class RocksDbStore : public TaskStore {
 public:
  static rocksdb::Status Open(const StoreOptions& opt,
                              std::unique_ptr<TaskStore>* out);

  ~RocksDbStore() override;

  RocksDbStore(const RocksDbStore&) = delete;
  RocksDbStore& operator=(const RocksDbStore&) = delete;

  rocksdb::Status Read(std::vector<Task>* out) override;
  rocksdb::Status Save(const std::vector<Task>& tasks) override;
  void Close() override;
  StoreBackend backend() const override { return StoreBackend::kRocksDB; }

 private:
  explicit RocksDbStore(bool sync) : sync_(sync) {}

  // Guards db_ against Close() racing with Read/Save during shutdown.
  std::mutex mu_;
  rocksdb::DB* db_ = nullptr;
  bool sync_;
};

class MemoryStore : public TaskStore {
 public:
  MemoryStore() = default;

  rocksdb::Status Read(std::vector<Task>* out) override;
  rocksdb::Status Save(const std::vector<Task>& tasks) override;
  StoreBackend backend() const override { return StoreBackend::kMemory; }

 private:
  std::mutex mu_;
  std::string serialized_ = "[]";
};

}  // namespace taskd
