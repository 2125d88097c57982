#pragma once

#include <vestry/schema/escrow_state.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/schema/recipient_state.hpp>
#include <vestry/schema/recipient_status.hpp>

#include <optional>

// Recipient lifecycle: unpaused <-> paused -> terminated.
//
// Every mutator leaves the recipient untouched and reports failure when the
// transition is not allowed from the current status.
namespace vestry::vesting {

/// Whether `from -> to` is an edge of the state machine. Self transitions and
/// anything out of terminated are rejected.
constexpr bool is_transition_allowed(const vestry::schema::recipient_status_t from,
                                     const vestry::schema::recipient_status_t to) {
  using vestry::schema::recipient_status_t;
  switch (from) {
    case recipient_status_t::unpaused:
      return to == recipient_status_t::paused ||
             to == recipient_status_t::terminated;
    case recipient_status_t::paused:
      return to == recipient_status_t::unpaused ||
             to == recipient_status_t::terminated;
    case recipient_status_t::terminated:
      return false;
  }
  return false;
}

/// unpaused -> paused, recording `now` as the pause instant.
bool pause(vestry::schema::recipient_state_t& recipient,
           vestry::schema::timestamp_seconds_t now);

/// paused -> unpaused. Shifts cliff_duration and end_time forward by the time
/// spent paused and returns that interval.
///
/// When the escrow is terminated the interval stops at terminated_at, which
/// keeps the recipient valued at its own pause instant. Throws
/// std::range_error if the clock reads earlier than the pause instant and
/// std::overflow_error if the shifted times would not fit in 64 bits.
std::optional<vestry::schema::duration_seconds_t> unpause(
    vestry::schema::recipient_state_t& recipient,
    vestry::schema::timestamp_seconds_t now,
    const vestry::schema::escrow_lifecycle_t& lifecycle);

/// unpaused or paused -> terminated.
bool terminate(vestry::schema::recipient_state_t& recipient);

}  // namespace vestry::vesting
