#pragma once

#include <tranche/schema/primitives.hpp>
#include <functional>

namespace tranche::execution {

/// Returns true when `account` has authenticated the current call.
using authorizer_t =
    std::function<bool(const tranche::schema::account_id_t& account)>;

}  // namespace tranche::execution
