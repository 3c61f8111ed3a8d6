#include <tranche/schema/encoding/scale/wire.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <limits>

namespace tranche::schema::encoding::scale {

namespace {

using bits_t = boost::multiprecision::uint128_t;

const bits_t kLowMask = bits_t{std::numeric_limits<uint64_t>::max()};

void store_word(uint8_t* out, const uint64_t value) {
  auto little = boost::endian::native_to_little(value);
  std::memcpy(out, &little, sizeof(little));
}

uint64_t load_word(const uint8_t* in) {
  auto little = uint64_t{};
  std::memcpy(&little, in, sizeof(little));
  return boost::endian::little_to_native(little);
}

}  // namespace

amount_wire_t to_wire(const amount_t& value) {
  auto bits = bits_t{};
  if (value < 0) {
    auto magnitude = static_cast<bits_t>(-value);
    bits = ~magnitude + 1;
  } else {
    bits = static_cast<bits_t>(value);
  }
  auto wire = amount_wire_t{};
  store_word(wire.data(), static_cast<uint64_t>(bits & kLowMask));
  store_word(wire.data() + 8, static_cast<uint64_t>(bits >> 64));
  return wire;
}

amount_t from_wire(const amount_wire_t& value) {
  auto low = load_word(value.data());
  auto high = load_word(value.data() + 8);
  auto bits = (bits_t{high} << 64) | bits_t{low};
  if ((high >> 63) != 0) {
    auto magnitude = bits_t{~bits + 1};
    return -static_cast<amount_t>(magnitude);
  }
  return static_cast<amount_t>(bits);
}

schedule_terms_wire_t to_wire(const schedule_terms_t& value) {
  return std::visit(
      overloaded{
          [](const stream_terms_t& terms) -> schedule_terms_wire_t {
            return stream_terms_wire_t{terms.start_time, terms.end_time};
          },
          [](const vesting_terms_t& terms) -> schedule_terms_wire_t {
            return vesting_terms_wire_t{terms.start_time, terms.cliff_duration,
                                        to_wire(terms.cliff_amount),
                                        terms.total_duration};
          }},
      value);
}

schedule_terms_t from_wire(const schedule_terms_wire_t& value) {
  return std::visit(
      overloaded{[](const stream_terms_wire_t& terms) -> schedule_terms_t {
                   return stream_terms_t{.start_time = std::get<0>(terms),
                                         .end_time = std::get<1>(terms)};
                 },
                 [](const vesting_terms_wire_t& terms) -> schedule_terms_t {
                   return vesting_terms_t{
                       .start_time = std::get<0>(terms),
                       .cliff_duration = std::get<1>(terms),
                       .cliff_amount = from_wire(std::get<2>(terms)),
                       .total_duration = std::get<3>(terms)};
                 }},
      value);
}

schedule_wire_t to_wire(const schedule_t& value) {
  return schedule_wire_t{value.version,
                         value.id,
                         value.sender,
                         value.recipient,
                         value.token,
                         to_wire(value.total_amount),
                         to_wire(value.claimed_amount),
                         to_wire(value.refunded_amount),
                         to_wire(value.terms),
                         value.status,
                         value.created_at,
                         value.last_update_time,
                         value.terminated_at,
                         value.label,
                         value.revocable};
}

schedule_t from_wire(const schedule_wire_t& value) {
  auto [version, id, sender, recipient, token, total, claimed, refunded, terms,
        status, created_at, last_update_time, terminated_at, label, revocable] =
      value;
  return schedule_t{.version = version,
                    .id = id,
                    .sender = sender,
                    .recipient = recipient,
                    .token = token,
                    .total_amount = from_wire(total),
                    .claimed_amount = from_wire(claimed),
                    .refunded_amount = from_wire(refunded),
                    .terms = from_wire(terms),
                    .status = status,
                    .created_at = created_at,
                    .last_update_time = last_update_time,
                    .terminated_at = terminated_at,
                    .label = label,
                    .revocable = revocable};
}

claim_record_wire_t to_wire(const claim_record_t& value) {
  return claim_record_wire_t{to_wire(value.amount), value.timestamp};
}

claim_record_t from_wire(const claim_record_wire_t& value) {
  return claim_record_t{.amount = from_wire(std::get<0>(value)),
                        .timestamp = std::get<1>(value)};
}

}  // namespace tranche::schema::encoding::scale
