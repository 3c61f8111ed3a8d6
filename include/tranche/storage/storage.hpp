#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tranche::storage {

using key_value_entry_t =
    std::pair<tranche::schema::bytes_t, tranche::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tranche::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tranche::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<tranche::schema::bytes_t> load(
      const tranche::schema::bytes_view_t& key) const;

  /// Persist every entry in one atomic batch.
  void write(const std::vector<key_value_entry_t>& entries);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tranche::storage
