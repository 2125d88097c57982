#pragma once
#include <vestry/schema/primitives.hpp>
#include <vestry/schema/recipient_status.hpp>

// Schema type: recipient state.
// Vesting workflow: one schedule per beneficiary account. The rate is fixed at
// creation; pausing shifts cliff and end instead of changing the rate.
namespace vestry::schema {

template <uint16_t Version>
struct recipient_state;

template <>
struct recipient_state<1> final {
  uint16_t version{1};
  account_id_t recipient{};
  timestamp_seconds_t start_time{};
  timestamp_seconds_t end_time{};
  duration_seconds_t cliff_duration{};
  timestamp_seconds_t last_paused_at{};
  amount_t vesting_per_second{};
  amount_t total_vesting_amount{};
  amount_t total_claimed{};
  recipient_status_t status{recipient_status_t::unpaused};
};

using recipient_state_t = recipient_state<1>;

}  // namespace vestry::schema
