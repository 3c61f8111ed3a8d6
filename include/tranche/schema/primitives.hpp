#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tranche::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using token_id_t = hash32_t;
using schedule_id_t = uint32_t;
/// Token quantities. Signed so that an inconsistent difference is visible
/// instead of wrapping.
using amount_t = boost::multiprecision::int128_t;
/// Intermediate precision for amount * elapsed products.
using wide_amount_t = boost::multiprecision::int256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

// int128_t is sign-magnitude and reaches 2^128 - 1; amounts are held to the
// two's complement 128-bit range so they fit the 16-byte wire form.
inline const amount_t kMaxAmount = (amount_t{1} << 127) - 1;
inline const amount_t kMinAmount = -(amount_t{1} << 127);

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

std::optional<amount_t> try_make_amount(const std::string_view& decimal);
std::string to_string(const amount_t& amount);

}  // namespace tranche::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
