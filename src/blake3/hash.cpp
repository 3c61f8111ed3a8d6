#include <blake3.h>
#include <tranche/blake3/hash.hpp>

namespace tranche::blake3 {

namespace {

tranche::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = tranche::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<tranche::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

tranche::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

tranche::schema::hash32_t hash(const tranche::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace tranche::blake3
