#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tranche/common/critical.hpp>
#include <tranche/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace tranche::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tranche::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tranche::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tranche::schema::bytes_view_t& key,
           const T& value);

  std::optional<tranche::schema::bytes_t> load(
      const tranche::schema::bytes_view_t& key) const;
  void write(const std::vector<key_value_entry_t>& entries);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tranche::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tranche::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tranche::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    tranche::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(tranche::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    tranche::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace tranche::storage
