#pragma once
#include <tranche/common/critical.hpp>
#include <tranche/schema/encoding/encoder.hpp>
#include <tranche/schema/encoding/scale/schedule_kind.hpp>
#include <tranche/schema/encoding/scale/schedule_status.hpp>
#include <tranche/schema/encoding/scale/wire.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace tranche::schema::encoding {

struct scale_encoder_tag {};

// Domain records are converted to their wire_form before SCALE sees them, so
// callers encode and decode schedule_t, claim_record_t and amount_t directly.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tranche::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tranche::schema::bytes_t& out);

  template <typename T>
  T decode(const tranche::schema::bytes_view_t& bytes);

  /// std::nullopt when the bytes are not a complete T.
  template <typename T>
  std::optional<T> try_decode(const tranche::schema::bytes_view_t& bytes);
};

template <typename T>
tranche::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(
      tranche::schema::encoding::scale::to_wire_form(obj));
  if (!encoded) {
    tranche::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tranche::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const tranche::schema::bytes_view_t& bytes) {
  using wire_t = tranche::schema::encoding::scale::wire_form_t<T>;
  auto decoded = ::scale::impl::memory::decode<wire_t>(bytes);
  if (!decoded) {
    tranche::common::critical("failed to decode SCALE bytes",
                              "Undecodable {}-byte row", bytes.size());
  }
  return tranche::schema::encoding::scale::from_wire_form<T>(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tranche::schema::bytes_view_t& bytes) {
  using wire_t = tranche::schema::encoding::scale::wire_form_t<T>;
  auto decoded = ::scale::impl::memory::decode<wire_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return tranche::schema::encoding::scale::from_wire_form<T>(decoded.value());
}

}  // namespace tranche::schema::encoding
