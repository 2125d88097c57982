#pragma once

#include <vestry/schema/error_code.hpp>
#include <vestry/schema/escrow_state.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/schema/recipient_state.hpp>

#include <map>
#include <optional>
#include <string>

namespace vestry::execution {

/// Broken precondition or invariant reported by the ledger.
struct ledger_violation final {
  vestry::schema::error_code code{};
  std::string reason;
};

using ledger_outcome_t = std::optional<ledger_violation>;

/// Escrow aggregate: global totals, the recipient table and the termination
/// switch. Every change to funded, allocated, claimed or seized amounts goes
/// through this type so the conservation checks live in one place:
///
/// - recipient.total_claimed <= recipient.total_vesting_amount
/// - total_claimed <= total_allocated_supply
/// - total_claimed + total_seized <= total_allocated_supply
///
/// A failed mutation leaves the ledger exactly as it was. The type is a value:
/// the engine copies it to checkpoint an operation and assigns it back to
/// roll one back.
class escrow_ledger final {
 public:
  explicit escrow_ledger(const vestry::schema::account_id_t& safe_address);

  const vestry::schema::escrow_state_t& state() const { return state_; }
  const std::map<vestry::schema::account_id_t,
                 vestry::schema::recipient_state_t>&
  recipients() const {
    return recipients_;
  }

  const vestry::schema::recipient_state_t* find(
      const vestry::schema::account_id_t& recipient) const;
  vestry::schema::recipient_state_t* find(
      const vestry::schema::account_id_t& recipient);
  bool contains(const vestry::schema::account_id_t& recipient) const;

  /// Store a new schedule and add its total to the allocated supply.
  /// Existing addresses are rejected with state_conflict.
  ledger_outcome_t allocate(const vestry::schema::recipient_state_t& recipient);

  void add_dust(const vestry::schema::amount_t& amount);

  /// Remove and return the accumulated dust.
  vestry::schema::amount_t take_dust();

  /// Credit a claim to the recipient and to the escrow total.
  ledger_outcome_t record_claim(const vestry::schema::account_id_t& recipient,
                                const vestry::schema::amount_t& amount);

  /// Account for a balance swept to the safe address.
  ledger_outcome_t record_seizure(const vestry::schema::amount_t& amount);

  /// Mark a recipient's locked balance as swept. False if already marked.
  bool mark_seized(const vestry::schema::account_id_t& recipient);
  bool is_seized(const vestry::schema::account_id_t& recipient) const;

  /// Flip the escrow to terminated. escrow_terminated if already flipped.
  ledger_outcome_t terminate(vestry::schema::timestamp_seconds_t now);

  void set_safe_address(const vestry::schema::account_id_t& safe_address);

  /// Re-check every conservation rule across the whole table.
  ledger_outcome_t check_invariants() const;

 private:
  vestry::schema::escrow_state_t state_;
  std::map<vestry::schema::account_id_t, vestry::schema::recipient_state_t>
      recipients_;
};

}  // namespace vestry::execution
