#pragma once

#include <tranche/schema/schedule_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tranche::schema,
                             schedule_kind_t,
                             tranche::schema::schedule_kind_t::stream,
                             tranche::schema::schedule_kind_t::vesting)
