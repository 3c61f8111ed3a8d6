#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace tranche::execution {

/// Rows written by one operation before they reach storage. Later writes to
/// the same key replace earlier ones.
class change_set final {
 public:
  void stage(tranche::schema::bytes_t key, tranche::schema::bytes_t value);

  /// Staged value for key, if any.
  std::optional<tranche::schema::bytes_t> find(
      const tranche::schema::bytes_view_t& key) const;

  std::vector<tranche::storage::key_value_entry_t> entries() const;

  bool empty() const;
  size_t size() const;
  void clear();

 private:
  std::map<tranche::schema::bytes_t, tranche::schema::bytes_t> rows_;
};

}  // namespace tranche::execution
