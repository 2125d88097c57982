#pragma once

#include <vestry/schema/escrow_state.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/schema/recipient_state.hpp>

#include <optional>
#include <string_view>

// Schedule model: pure valuation of a single recipient. Nothing here reads a
// clock or mutates state; callers pass the instant and the escrow lifecycle.
//
// Amounts use checked 256-bit arithmetic. An underflow means the stored
// fields already violate claimed + locked <= total, and surfaces as
// std::range_error instead of a wrapped value.
namespace vestry::vesting {

/// Schedule parameters of one entry in a funding batch.
struct schedule_terms final {
  vestry::schema::amount_t total_vesting_amount{};
  vestry::schema::timestamp_seconds_t start_time{};
  vestry::schema::timestamp_seconds_t end_time{};
  vestry::schema::duration_seconds_t cliff_duration{};
};

/// Check creation rules and return the first violated one, or std::nullopt.
///
/// `now` is only consulted when `allow_past_start_time` is false.
std::optional<std::string_view> validate_terms(
    const schedule_terms& terms,
    vestry::schema::timestamp_seconds_t now,
    bool allow_past_start_time);

/// Build a fresh unpaused schedule. Terms must already be valid.
///
/// The per-second rate is truncated here, once, and never recomputed.
vestry::schema::recipient_state_t make_recipient_state(
    const vestry::schema::account_id_t& recipient,
    const schedule_terms& terms);

/// First instant at which a claim may succeed: start_time + cliff_duration.
/// Throws std::overflow_error if the sum does not fit in 64 bits.
vestry::schema::timestamp_seconds_t claim_start_time(
    const vestry::schema::recipient_state_t& recipient);

/// Seconds over which the rate applies: end - start - cliff. Invariant under
/// pause compensation, which shifts end and cliff by the same amount.
vestry::schema::duration_seconds_t vesting_duration(
    const vestry::schema::recipient_state_t& recipient);

/// Part of the total lost to rate truncation:
/// total - vesting_per_second * vesting_duration.
vestry::schema::amount_t truncation_remainder(
    const vestry::schema::recipient_state_t& recipient);

/// Instant the schedule is valued at. Paused schedules are frozen at their
/// pause instant, a terminated escrow freezes unpaused ones at termination.
/// std::nullopt for terminated recipients.
std::optional<vestry::schema::timestamp_seconds_t> valuation_instant(
    const vestry::schema::recipient_state_t& recipient,
    vestry::schema::timestamp_seconds_t now,
    const vestry::schema::escrow_lifecycle_t& lifecycle);

/// Not yet vested. Zero once the valuation instant reaches end_time; before
/// that the truncation remainder stays locked so the final claim releases the
/// exact total. std::nullopt for terminated recipients.
std::optional<vestry::schema::amount_t> locked_amount(
    const vestry::schema::recipient_state_t& recipient,
    vestry::schema::timestamp_seconds_t now,
    const vestry::schema::escrow_lifecycle_t& lifecycle);

/// total - locked. std::nullopt for terminated recipients.
std::optional<vestry::schema::amount_t> vested_amount(
    const vestry::schema::recipient_state_t& recipient,
    vestry::schema::timestamp_seconds_t now,
    const vestry::schema::escrow_lifecycle_t& lifecycle);

/// total - (claimed + locked). std::nullopt for terminated recipients.
std::optional<vestry::schema::amount_t> claimable_amount(
    const vestry::schema::recipient_state_t& recipient,
    vestry::schema::timestamp_seconds_t now,
    const vestry::schema::escrow_lifecycle_t& lifecycle);

/// Unpaused and past the cliff.
bool can_claim(const vestry::schema::recipient_state_t& recipient,
               vestry::schema::timestamp_seconds_t now);

}  // namespace vestry::vesting
