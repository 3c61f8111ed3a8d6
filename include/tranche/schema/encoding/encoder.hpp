#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tranche::schema::encoding {

// The wire library is chosen at build time through the tag. Callers hold an
// encoder<tag> and never name the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  tranche::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tranche::schema::bytes_t& out);

  template <typename T>
  T decode(const tranche::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tranche::schema::bytes_view_t& bytes);
};

}  // namespace tranche::schema::encoding
