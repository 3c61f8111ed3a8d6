#include <tranche/common/critical.hpp>
#include <tranche/storage/rocksdb/storage.hpp>

namespace tranche::storage {

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
    tranche::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<tranche::schema::bytes_t> storage<rocksdb_storage_tag>::load(
    const tranche::schema::bytes_view_t& key) const {
  if (!database) {
    tranche::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tranche::common::critical("Failed to get value from RocksDB");
  }
  return tranche::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) {
  if (!database) {
    tranche::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(tranche::schema::make_bytes_view(key)),
                  detail::to_slice(tranche::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      spdlog::error("Failed to stage batch write: {}", put_status.ToString());
      tranche::common::critical("failed writing key into batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch: {}", write_status.ToString());
    tranche::common::critical("failed to commit write batch");
  }
  spdlog::debug("Committed {} rows", entries.size());
}

}  // namespace tranche::storage
