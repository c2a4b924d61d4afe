#include <strata/common/critical.hpp>
#include <strata/storage/rocksdb/storage.hpp>

namespace strata::storage {

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
    strata::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened container store at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const strata::schema::bytes_view_t& key) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    strata::common::critical("Failed to delete key from RocksDB");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const strata::schema::bytes_view_t& prefix) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
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
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    strata::common::critical("Failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const strata::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      strata::common::critical("failed deleting key during prefix replacement");
    }
    iterator->Next();
  }

  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(strata::schema::make_bytes_view(key)),
                  detail::to_slice(strata::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      strata::common::critical("failed writing key during prefix replacement");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    strata::common::critical("failed to commit prefix replacement");
  }
}

}  // namespace strata::storage
