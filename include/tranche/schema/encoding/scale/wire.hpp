#pragma once
#include <tranche/schema/claim_record.hpp>
#include <tranche/schema/encoding/scale/schedule_status.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule.hpp>

#include <array>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

// Persisted layouts expressed only in types the SCALE library encodes
// natively. Amounts travel as 16-byte little-endian two's complement.
namespace tranche::schema::encoding::scale {

using amount_wire_t = std::array<uint8_t, 16>;

using stream_terms_wire_t =
    std::tuple<timestamp_seconds_t, timestamp_seconds_t>;

using vesting_terms_wire_t = std::tuple<timestamp_seconds_t,
                                        duration_seconds_t,
                                        amount_wire_t,
                                        duration_seconds_t>;

using schedule_terms_wire_t =
    std::variant<stream_terms_wire_t, vesting_terms_wire_t>;

using schedule_wire_t = std::tuple<uint16_t,
                                   schedule_id_t,
                                   account_id_t,
                                   account_id_t,
                                   token_id_t,
                                   amount_wire_t,
                                   amount_wire_t,
                                   amount_wire_t,
                                   schedule_terms_wire_t,
                                   schedule_status_t,
                                   timestamp_seconds_t,
                                   timestamp_seconds_t,
                                   std::optional<timestamp_seconds_t>,
                                   std::string,
                                   bool>;

using claim_record_wire_t = std::tuple<amount_wire_t, timestamp_seconds_t>;

amount_wire_t to_wire(const amount_t& value);
amount_t from_wire(const amount_wire_t& value);

schedule_terms_wire_t to_wire(const schedule_terms_t& value);
schedule_terms_t from_wire(const schedule_terms_wire_t& value);

schedule_wire_t to_wire(const schedule_t& value);
schedule_t from_wire(const schedule_wire_t& value);

claim_record_wire_t to_wire(const claim_record_t& value);
claim_record_t from_wire(const claim_record_wire_t& value);

/// Persisted form of T. Types SCALE encodes natively map to themselves.
template <typename T>
struct wire_form {
  using type = T;
};

template <>
struct wire_form<amount_t> {
  using type = amount_wire_t;
};

template <>
struct wire_form<schedule_t> {
  using type = schedule_wire_t;
};

template <>
struct wire_form<claim_record_t> {
  using type = claim_record_wire_t;
};

template <typename T>
struct wire_form<std::vector<T>> {
  using type = std::vector<typename wire_form<T>::type>;
};

template <typename T>
using wire_form_t = typename wire_form<T>::type;

template <typename T>
struct is_vector : std::false_type {};

template <typename T>
struct is_vector<std::vector<T>> : std::true_type {};

template <typename T>
wire_form_t<T> to_wire_form(const T& value) {
  if constexpr (std::is_same_v<wire_form_t<T>, T>) {
    return value;
  } else if constexpr (is_vector<T>::value) {
    auto rows = wire_form_t<T>{};
    rows.reserve(value.size());
    for (const auto& row : value) {
      rows.push_back(to_wire_form(row));
    }
    return rows;
  } else {
    return to_wire(value);
  }
}

template <typename T>
T from_wire_form(const wire_form_t<T>& value) {
  if constexpr (std::is_same_v<wire_form_t<T>, T>) {
    return value;
  } else if constexpr (is_vector<T>::value) {
    auto rows = T{};
    rows.reserve(value.size());
    for (const auto& row : value) {
      rows.push_back(from_wire_form<typename T::value_type>(row));
    }
    return rows;
  } else {
    return from_wire(value);
  }
}

}  // namespace tranche::schema::encoding::scale
