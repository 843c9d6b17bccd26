#include <capvault/common/critical.hpp>
#include <capvault/storage/rocksdb/storage.hpp>

namespace capvault::storage {

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
    capvault::common::critical("Failed to open RocksDB at {}: {}", path,
                               status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<capvault::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const capvault::schema::bytes_view_t& key) const {
  if (!database) {
    capvault::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    capvault::common::critical("Failed to get value from RocksDB: {}",
                               status.ToString());
  }
  return capvault::schema::bytes_t(std::begin(value), std::end(value));
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const capvault::schema::bytes_view_t& prefix) const {
  if (!database) {
    capvault::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_slice);
  while (iterator->Valid() && iterator->key().starts_with(prefix_slice)) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    capvault::common::critical("RocksDB prefix scan failed: {}",
                               iterator->status().ToString());
  }
  return entries;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const capvault::schema::bytes_view_t& first,
    const capvault::schema::bytes_view_t& last) const {
  if (!database) {
    capvault::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto last_slice = detail::to_slice(last);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(first));
       iterator->Valid() && iterator->key().compare(last_slice) <= 0;
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    capvault::common::critical("RocksDB range scan failed: {}",
                               iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_set& writes) const {
  if (!database) {
    capvault::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.deletes) {
    auto delete_status = batch.Delete(detail::to_slice(
        capvault::schema::bytes_view_t{key.data(), key.size()}));
    if (!delete_status.ok()) {
      capvault::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : writes.puts) {
    auto put_status = batch.Put(
        detail::to_slice(capvault::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            capvault::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      capvault::common::critical("failed staging put in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    capvault::common::critical("failed to commit write batch");
  }
}

}  // namespace capvault::storage
