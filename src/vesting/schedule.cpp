#include <vestry/vesting/schedule.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace vestry::schema;

namespace vestry::vesting {

std::optional<std::string_view> validate_terms(const schedule_terms& terms,
                                               const timestamp_seconds_t now,
                                               const bool allow_past_start_time) {
  if (terms.total_vesting_amount == 0) {
    return "vesting amount must be greater than zero";
  }
  if (!allow_past_start_time && terms.start_time <= now) {
    return "start time must be in the future";
  }
  if (terms.end_time <= terms.start_time) {
    return "end time must be after start time";
  }
  if (terms.cliff_duration >= terms.end_time - terms.start_time) {
    return "cliff must be shorter than the vesting period";
  }
  return std::nullopt;
}

recipient_state_t make_recipient_state(const account_id_t& recipient,
                                       const schedule_terms& terms) {
  auto state = recipient_state_t{};
  state.recipient = recipient;
  state.start_time = terms.start_time;
  state.end_time = terms.end_time;
  state.cliff_duration = terms.cliff_duration;
  state.last_paused_at = 0;
  state.total_vesting_amount = terms.total_vesting_amount;
  state.total_claimed = 0;
  state.status = recipient_status_t::unpaused;
  state.vesting_per_second =
      terms.total_vesting_amount / amount_t{vesting_duration(state)};
  return state;
}

timestamp_seconds_t claim_start_time(const recipient_state_t& recipient) {
  if (recipient.start_time >
      std::numeric_limits<timestamp_seconds_t>::max() -
          recipient.cliff_duration) {
    throw std::overflow_error("schedule cliff ends past max time");
  }
  return recipient.start_time + recipient.cliff_duration;
}

duration_seconds_t vesting_duration(const recipient_state_t& recipient) {
  if (recipient.end_time < claim_start_time(recipient)) {
    throw std::range_error("schedule cliff extends past its end time");
  }
  return recipient.end_time - claim_start_time(recipient);
}

amount_t truncation_remainder(const recipient_state_t& recipient) {
  return recipient.total_vesting_amount -
         recipient.vesting_per_second * amount_t{vesting_duration(recipient)};
}

std::optional<timestamp_seconds_t> valuation_instant(
    const recipient_state_t& recipient,
    const timestamp_seconds_t now,
    const escrow_lifecycle_t& lifecycle) {
  switch (recipient.status) {
    case recipient_status_t::terminated:
      return std::nullopt;
    case recipient_status_t::paused:
      return recipient.last_paused_at;
    case recipient_status_t::unpaused:
      break;
  }
  // Freezing comes before the end-time check in locked_amount, so a seized
  // recipient stays locked after end_time.
  if (auto frozen_at = terminated_at(lifecycle)) {
    return std::min(now, *frozen_at);
  }
  return now;
}

std::optional<amount_t> locked_amount(const recipient_state_t& recipient,
                                      const timestamp_seconds_t now,
                                      const escrow_lifecycle_t& lifecycle) {
  auto instant = valuation_instant(recipient, now, lifecycle);
  if (!instant) {
    return std::nullopt;
  }
  if (*instant >= recipient.end_time) {
    return amount_t{0};
  }
  auto from = std::max(*instant, claim_start_time(recipient));
  auto unvested_seconds = amount_t{recipient.end_time - from};
  return recipient.vesting_per_second * unvested_seconds +
         truncation_remainder(recipient);
}

std::optional<amount_t> vested_amount(const recipient_state_t& recipient,
                                      const timestamp_seconds_t now,
                                      const escrow_lifecycle_t& lifecycle) {
  auto locked = locked_amount(recipient, now, lifecycle);
  if (!locked) {
    return std::nullopt;
  }
  return recipient.total_vesting_amount - *locked;
}

std::optional<amount_t> claimable_amount(const recipient_state_t& recipient,
                                         const timestamp_seconds_t now,
                                         const escrow_lifecycle_t& lifecycle) {
  auto locked = locked_amount(recipient, now, lifecycle);
  if (!locked) {
    return std::nullopt;
  }
  return recipient.total_vesting_amount - (recipient.total_claimed + *locked);
}

bool can_claim(const recipient_state_t& recipient,
               const timestamp_seconds_t now) {
  return recipient.status == recipient_status_t::unpaused &&
         now >= claim_start_time(recipient);
}

}  // namespace vestry::vesting
