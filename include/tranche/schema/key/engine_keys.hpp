#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/schedule_kind.hpp>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Treasury workflow: canonical key prefixes and key builders for schedule
// state, secondary indexes, claim history and token balances.
namespace tranche::schema::key {

inline constexpr std::string_view kAdminKeyPrefix{"SYS|STATE|ADMIN|"};
inline constexpr std::string_view kScheduleCountKeyPrefix{
    "SYS|STATE|SCHEDULE_COUNT|"};
inline constexpr std::string_view kScheduleKeyPrefix{"SYS|STATE|SCHEDULE|"};
inline constexpr std::string_view kBySenderKeyPrefix{"SYS|STATE|BY_SENDER|"};
inline constexpr std::string_view kByRecipientKeyPrefix{
    "SYS|STATE|BY_RECIPIENT|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kClaimHistoryKeyPrefix{
    "SYS|HISTORY|CLAIM|"};

template <typename Encoder, typename T>
tranche::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
tranche::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
tranche::schema::bytes_t make_admin_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAdminKeyPrefix);
}

template <typename Encoder>
tranche::schema::bytes_t make_schedule_count_key(
    Encoder& encoder,
    const tranche::schema::schedule_kind_t kind) {
  return make_prefixed_key(encoder, kScheduleCountKeyPrefix, kind);
}

template <typename Encoder>
tranche::schema::bytes_t make_schedule_key(
    Encoder& encoder,
    const tranche::schema::schedule_kind_t kind,
    const tranche::schema::schedule_id_t id) {
  return make_prefixed_key(encoder, kScheduleKeyPrefix, std::tuple{kind, id});
}

template <typename Encoder>
tranche::schema::bytes_t make_by_sender_key(
    Encoder& encoder,
    const tranche::schema::schedule_kind_t kind,
    const tranche::schema::account_id_t& sender) {
  return make_prefixed_key(encoder, kBySenderKeyPrefix,
                           std::tuple{kind, sender});
}

template <typename Encoder>
tranche::schema::bytes_t make_by_recipient_key(
    Encoder& encoder,
    const tranche::schema::schedule_kind_t kind,
    const tranche::schema::account_id_t& recipient) {
  return make_prefixed_key(encoder, kByRecipientKeyPrefix,
                           std::tuple{kind, recipient});
}

template <typename Encoder>
tranche::schema::bytes_t make_claim_history_key(
    Encoder& encoder,
    const tranche::schema::schedule_kind_t kind,
    const tranche::schema::schedule_id_t id) {
  return make_prefixed_key(encoder, kClaimHistoryKeyPrefix,
                           std::tuple{kind, id});
}

template <typename Encoder>
tranche::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const tranche::schema::token_id_t& token,
    const tranche::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{token, account});
}

}  // namespace tranche::schema::key
