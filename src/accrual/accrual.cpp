#include <tranche/accrual/accrual.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace tranche::accrual {

namespace {

using tranche::schema::amount_t;
using tranche::schema::error_code;
using tranche::schema::schedule_kind_t;
using tranche::schema::schedule_status_t;
using tranche::schema::wide_amount_t;

amount_t clamp(const amount_t& value, const amount_t& total) {
  if (value < 0) {
    return 0;
  }
  if (value > total) {
    return total;
  }
  return value;
}

}  // namespace

amount_t prorate(const amount_t& total,
                 const uint64_t elapsed,
                 const uint64_t duration) {
  if (duration == 0) {
    return total;
  }
  auto product = wide_amount_t{total} * wide_amount_t{elapsed};
  auto quotient = wide_amount_t{product / wide_amount_t{duration}};
  return static_cast<amount_t>(quotient);
}

amount_t accrued(const tranche::schema::stream_terms_t& terms,
                 const amount_t& total,
                 const tranche::schema::timestamp_seconds_t now) {
  if (total <= 0 || now <= terms.start_time) {
    return 0;
  }
  if (now >= terms.end_time) {
    return total;
  }
  auto released = prorate(total, now - terms.start_time,
                          terms.end_time - terms.start_time);
  spdlog::debug("stream accrual at {}: {} of {}", now,
                tranche::schema::to_string(released),
                tranche::schema::to_string(total));
  return clamp(released, total);
}

amount_t accrued(const tranche::schema::vesting_terms_t& terms,
                 const amount_t& total,
                 const tranche::schema::timestamp_seconds_t now) {
  if (total <= 0 || now < terms.start_time) {
    return 0;
  }
  // Offsets from start_time so a far-future start cannot overflow.
  auto elapsed = now - terms.start_time;
  if (elapsed < terms.cliff_duration) {
    return 0;
  }
  if (elapsed >= terms.total_duration) {
    return total;
  }
  auto cliff_amount = clamp(terms.cliff_amount, total);
  auto linear = prorate(total - cliff_amount, elapsed - terms.cliff_duration,
                        terms.total_duration - terms.cliff_duration);
  spdlog::debug("vesting accrual at {}: cliff {} plus {}", now,
                tranche::schema::to_string(cliff_amount),
                tranche::schema::to_string(linear));
  return clamp(cliff_amount + linear, total);
}

amount_t accrued(const tranche::schema::schedule_terms_t& terms,
                 const amount_t& total,
                 const tranche::schema::timestamp_seconds_t now) {
  return std::visit(
      [&](const auto& value) -> amount_t { return accrued(value, total, now); },
      terms);
}

amount_t claimable(const amount_t& accrued, const amount_t& claimed) {
  if (accrued <= claimed) {
    return 0;
  }
  return accrued - claimed;
}

error_code validate(const tranche::schema::stream_terms_t& terms,
                    const amount_t& total) {
  if (total <= 0 || total > tranche::schema::kMaxAmount) {
    return error_code::invalid_amount;
  }
  if (terms.end_time <= terms.start_time) {
    return error_code::invalid_duration;
  }
  return error_code::ok;
}

error_code validate(const tranche::schema::vesting_terms_t& terms,
                    const amount_t& total) {
  if (total <= 0 || total > tranche::schema::kMaxAmount) {
    return error_code::invalid_amount;
  }
  if (terms.total_duration == 0) {
    return error_code::invalid_schedule;
  }
  if (terms.cliff_duration >= terms.total_duration) {
    return error_code::invalid_duration;
  }
  if (terms.cliff_amount < 0 || terms.cliff_amount > total) {
    return error_code::invalid_amount;
  }
  if (terms.start_time > std::numeric_limits<uint64_t>::max() -
                             terms.total_duration) {
    return error_code::invalid_schedule;
  }
  return error_code::ok;
}

error_code validate(const tranche::schema::schedule_terms_t& terms,
                    const amount_t& total) {
  return std::visit(
      [&](const auto& value) -> error_code { return validate(value, total); },
      terms);
}

bool can_transition(const schedule_kind_t kind,
                    const schedule_status_t from,
                    const schedule_status_t to) {
  if (from != schedule_status_t::active) {
    return false;
  }
  switch (to) {
    case schedule_status_t::completed:
      return true;
    case schedule_status_t::cancelled:
      return kind == schedule_kind_t::stream;
    case schedule_status_t::revoked:
      return kind == schedule_kind_t::vesting;
    case schedule_status_t::active:
      return false;
  }
  return false;
}

}  // namespace tranche::accrual
