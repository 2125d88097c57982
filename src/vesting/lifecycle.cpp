#include <vestry/vesting/lifecycle.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace vestry::schema;

namespace vestry::vesting {

bool pause(recipient_state_t& recipient, const timestamp_seconds_t now) {
  if (!is_transition_allowed(recipient.status, recipient_status_t::paused)) {
    return false;
  }
  recipient.status = recipient_status_t::paused;
  recipient.last_paused_at = now;
  return true;
}

std::optional<duration_seconds_t> unpause(recipient_state_t& recipient,
                                          const timestamp_seconds_t now,
                                          const escrow_lifecycle_t& lifecycle) {
  if (!is_transition_allowed(recipient.status, recipient_status_t::unpaused)) {
    return std::nullopt;
  }
  auto resumed_at = now;
  if (auto frozen_at = terminated_at(lifecycle)) {
    resumed_at = std::min(now, *frozen_at);
  }
  if (resumed_at < recipient.last_paused_at) {
    throw std::range_error("unpause observed a time before the pause instant");
  }

  auto paused_for = resumed_at - recipient.last_paused_at;
  constexpr auto kMaxSeconds = std::numeric_limits<uint64_t>::max();
  if (recipient.end_time > kMaxSeconds - paused_for ||
      recipient.cliff_duration > kMaxSeconds - paused_for) {
    throw std::overflow_error("unpause would move the schedule past max time");
  }
  recipient.cliff_duration += paused_for;
  recipient.end_time += paused_for;
  recipient.status = recipient_status_t::unpaused;
  return paused_for;
}

bool terminate(recipient_state_t& recipient) {
  if (!is_transition_allowed(recipient.status,
                             recipient_status_t::terminated)) {
    return false;
  }
  recipient.status = recipient_status_t::terminated;
  return true;
}

}  // namespace vestry::vesting
