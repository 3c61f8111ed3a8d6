#include <tranche/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tranche::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto digits = normalize_hex(hex);
  auto hash = hash32_t{};
  if (digits.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_nibble(digits[2 * i]);
    auto low = hex_nibble(digits[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  return try_make_hash32(hex).value_or(make_zero_hash());
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<amount_t> try_make_amount(const std::string_view& decimal) {
  auto digits = decimal;
  auto negative = false;
  if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }
  if (digits.empty() || digits.size() > 40) {
    return std::nullopt;
  }

  auto value = wide_amount_t{0};
  for (const auto c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
  }
  if (negative) {
    value = -value;
  }
  if (value > wide_amount_t{kMaxAmount} || value < wide_amount_t{kMinAmount}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace tranche::schema
