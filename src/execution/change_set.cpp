#include <tranche/execution/change_set.hpp>

#include <utility>

namespace tranche::execution {

void change_set::stage(tranche::schema::bytes_t key,
                       tranche::schema::bytes_t value) {
  rows_.insert_or_assign(std::move(key), std::move(value));
}

std::optional<tranche::schema::bytes_t> change_set::find(
    const tranche::schema::bytes_view_t& key) const {
  auto it = rows_.find(tranche::schema::make_bytes(key));
  if (it == std::end(rows_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<tranche::storage::key_value_entry_t> change_set::entries() const {
  auto result = std::vector<tranche::storage::key_value_entry_t>{};
  result.reserve(rows_.size());
  for (const auto& [key, value] : rows_) {
    result.emplace_back(key, value);
  }
  return result;
}

bool change_set::empty() const {
  return rows_.empty();
}

size_t change_set::size() const {
  return rows_.size();
}

void change_set::clear() {
  rows_.clear();
}

}  // namespace tranche::execution
