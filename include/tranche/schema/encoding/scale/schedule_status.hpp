#pragma once

#include <tranche/schema/schedule_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tranche::schema,
                             schedule_status_t,
                             tranche::schema::schedule_status_t::active,
                             tranche::schema::schedule_status_t::completed,
                             tranche::schema::schedule_status_t::cancelled,
                             tranche::schema::schedule_status_t::revoked)
