#pragma once

#include <tranche/execution/change_set.hpp>
#include <tranche/schema/transaction_event.hpp>
#include <tranche/schema/transfer_instruction.hpp>
#include <functional>
#include <vector>

namespace tranche::execution {

/// Runs every instruction or none of them. Returns false when the list was
/// rejected; nothing has moved in that case. An executor that keeps its rows
/// in the engine's store stages them into `pending`, which the engine writes
/// in the same batch as the schedule rows. Anything staged is dropped when
/// the executor returns false.
using transfer_executor_t = std::function<bool(
    const std::vector<tranche::schema::transfer_instruction_t>& transfers,
    change_set& pending)>;

/// Receives events after the operation that produced them has committed.
using event_sink_t =
    std::function<void(const tranche::schema::transaction_event_t& event)>;

}  // namespace tranche::execution
