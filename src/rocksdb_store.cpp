#include <taskd/store.hpp>

#include <rocksdb/options.h>

#include <trantor/utils/Logger.h>

#include <utility>

namespace taskd {

namespace {

// The whole collection lives under one key of the default column family.
constexpr const char* kTasksKey = "tasks";

}  // namespace

rocksdb::Status RocksDbStore::Open(const StoreOptions& opt,
                                   std::unique_ptr<TaskStore>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.path.empty()) {
    return rocksdb::Status::InvalidArgument("rocksdb path is empty");
  }

  auto store = std::unique_ptr<RocksDbStore>(new RocksDbStore(opt.sync));

  rocksdb::Options options;
  options.create_if_missing = true;

  rocksdb::DB* db = nullptr;
  rocksdb::Status s = rocksdb::DB::Open(options, opt.path, &db);
  if (!s.ok()) return s;
  store->db_ = db;

  std::string existing;
  s = db->Get(rocksdb::ReadOptions(), kTasksKey, &existing);
  if (s.IsNotFound()) {
    s = store->Save({});
    if (!s.ok()) {
      store->Close();
      return s;
    }
    LOG_INFO << "Initialized empty task collection in " << opt.path;
  } else if (!s.ok()) {
    store->Close();
    return s;
  }

  *out = std::move(store);
  return rocksdb::Status::OK();
}

RocksDbStore::~RocksDbStore() { Close(); }

void RocksDbStore::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return;
  delete db_;
  db_ = nullptr;
}

rocksdb::Status RocksDbStore::Read(std::vector<Task>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string value;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return rocksdb::Status::IOError("store is closed");
    auto s = db_->Get(rocksdb::ReadOptions(), kTasksKey, &value);
    if (!s.ok()) return s;
  }
  return ParseTasks(value, out);
}

rocksdb::Status RocksDbStore::Save(const std::vector<Task>& tasks) {
  std::string value = SerializeTasks(tasks);

  rocksdb::WriteOptions wo;
  wo.sync = sync_;

  std::lock_guard<std::mutex> lock(mu_);
  if (!db_) return rocksdb::Status::IOError("store is closed");
  return db_->Put(wo, kTasksKey, value);
}

}  // namespace taskd
