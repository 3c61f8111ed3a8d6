#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: transfer instruction.
// Treasury workflow: one movement of value handed to the transfer executor.
// An operation hands over all of its instructions in a single call.
namespace tranche::schema {

template <uint16_t Version>
struct transfer_instruction;

template <>
struct transfer_instruction<1> final {
  token_id_t token{};
  account_id_t from{};
  account_id_t to{};
  amount_t amount{};
};

using transfer_instruction_t = transfer_instruction<1>;

}  // namespace tranche::schema
