#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: create stream.
// Treasury workflow: parameters of one salary stream; the authenticated
// sender is passed alongside so a batch shares a single sender.
namespace tranche::schema {

template <uint16_t Version>
struct create_stream;

template <>
struct create_stream<1> final {
  account_id_t recipient{};
  token_id_t token{};
  amount_t total_amount{};
  timestamp_seconds_t start_time{};
  timestamp_seconds_t end_time{};
};

using create_stream_t = create_stream<1>;

}  // namespace tranche::schema
