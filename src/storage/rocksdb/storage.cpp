#include <quill/common/critical.hpp>
#include <quill/storage/rocksdb/storage.hpp>

namespace quill::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    quill::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::exists(
    const quill::schema::bytes_view_t& key) const {
  if (!database) {
    quill::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to look up RocksDB key: {}", status.ToString());
    quill::common::critical("Failed to look up RocksDB key");
  }
  return true;
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) {
  if (!database) {
    quill::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletions) {
    auto delete_status = rocks_batch.Delete(
        detail::to_slice(quill::schema::bytes_view_t{key.data(), key.size()}));
    if (!delete_status.ok()) {
      spdlog::error("Failed staging RocksDB delete: {}",
                    delete_status.ToString());
      quill::common::critical("Failed staging RocksDB delete");
    }
  }
  for (const auto& [key, value] : batch.entries) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(quill::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            quill::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      spdlog::error("Failed staging RocksDB write: {}", put_status.ToString());
      quill::common::critical("Failed staging RocksDB write");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    quill::common::critical("Failed to commit RocksDB batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const quill::schema::bytes_view_t& prefix) const {
  if (!database) {
    quill::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    quill::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace quill::storage
