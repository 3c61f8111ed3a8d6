#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: stream terms.
// Treasury workflow: continuous linear release over [start_time, end_time].
namespace tranche::schema {

template <uint16_t Version>
struct stream_terms;

template <>
struct stream_terms<1> final {
  timestamp_seconds_t start_time{};
  timestamp_seconds_t end_time{};
};

using stream_terms_t = stream_terms<1>;

}  // namespace tranche::schema
