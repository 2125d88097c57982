#pragma once
#include <vestry/schema/primitives.hpp>

#include <optional>
#include <set>
#include <variant>

// Schema type: escrow state.
// Vesting workflow: global accounting for every schedule funded through the
// escrow, plus the one-way termination switch.
namespace vestry::schema {

struct escrow_active_t final {};

struct escrow_terminated_t final {
  timestamp_seconds_t terminated_at{};
};

// Termination is only reachable by replacing the active alternative, and the
// freeze instant only exists inside the terminated one.
using escrow_lifecycle_t = std::variant<escrow_active_t, escrow_terminated_t>;

inline bool is_terminated(const escrow_lifecycle_t& lifecycle) {
  return std::holds_alternative<escrow_terminated_t>(lifecycle);
}

inline std::optional<timestamp_seconds_t> terminated_at(
    const escrow_lifecycle_t& lifecycle) {
  if (const auto* terminated = std::get_if<escrow_terminated_t>(&lifecycle)) {
    return terminated->terminated_at;
  }
  return std::nullopt;
}

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  uint16_t version{1};
  amount_t total_allocated_supply{};
  amount_t total_claimed{};
  amount_t total_seized{};
  amount_t dust{};
  account_id_t safe_address{};
  escrow_lifecycle_t lifecycle{escrow_active_t{}};
  std::set<account_id_t> seized;
};

using escrow_state_t = escrow_state<1>;

}  // namespace vestry::schema
