#pragma once

#include <vestry/execution/collaborators.hpp>
#include <vestry/execution/escrow_ledger.hpp>
#include <vestry/schema/add_recipients.hpp>
#include <vestry/schema/escrow_config.hpp>
#include <vestry/schema/escrow_state.hpp>
#include <vestry/schema/operation_result.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/schema/recipient_state.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace vestry::execution {

/// Deterministic vesting escrow.
///
/// Holds every recipient schedule funded through it and exposes the
/// administrator and recipient operations. Operations are serialized, read the
/// clock once on entry and are all-or-nothing: a failing operation returns a
/// non-zero code and leaves the escrow exactly as it found it.
///
/// Accounting is updated before funds are pushed out. If the adapter then
/// fails, the pre-operation state is restored. The one exception is
/// `terminate_recipient`, whose recipient payout stays recorded once it has
/// been transferred even if the sweep that follows fails. Mutations attempted from inside
/// an adapter callback are rejected with `reentrant_call`; queries are not.
class engine final {
 public:
  /// Construct an active escrow.
  ///
  /// Missing collaborators or a zero safe address are configuration faults
  /// and terminate the process.
  engine(const vestry::schema::escrow_config_t& config,
         funds_adapter_t funds,
         authorizer_t is_administrator,
         time_source_t clock);

  /// Pull `batch.total_funding` from `caller` and create one unpaused schedule
  /// per entry. The unallocated part of the funding is kept as dust.
  vestry::schema::operation_result_t add_recipients(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::add_recipients_t& batch);

  /// Stop vesting progress for `recipient` at the current instant.
  vestry::schema::operation_result_t pause(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::account_id_t& recipient);

  /// Resume vesting; the paused interval is added to cliff and end.
  vestry::schema::operation_result_t unpause(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::account_id_t& recipient);

  /// Pay out what is claimable, sweep the rest of the entitlement to the safe
  /// address and close the schedule for good.
  vestry::schema::operation_result_t terminate_recipient(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::account_id_t& recipient);

  /// Freeze every schedule at the current instant. One-way.
  vestry::schema::operation_result_t terminate_escrow(
      const vestry::schema::account_id_t& caller);

  /// Withdraw `amount` of the caller's vested tokens.
  vestry::schema::operation_result_t claim(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::amount_t& amount);

  /// After termination, sweep the frozen locked balances of `recipients` to
  /// the safe address in a single transfer. Addresses that are unknown,
  /// terminated or already seized are skipped.
  vestry::schema::operation_result_t seize_locked_tokens(
      const vestry::schema::account_id_t& caller,
      const std::vector<vestry::schema::account_id_t>& recipients);

  /// Sweep accumulated dust to the safe address.
  vestry::schema::operation_result_t transfer_dust(
      const vestry::schema::account_id_t& caller);

  vestry::schema::operation_result_t update_safe_address(
      const vestry::schema::account_id_t& caller,
      const vestry::schema::account_id_t& safe_address);

  std::optional<vestry::schema::recipient_state_t> recipient(
      const vestry::schema::account_id_t& recipient) const;

  vestry::schema::query_result_t locked_amount(
      const vestry::schema::account_id_t& recipient) const;
  vestry::schema::query_result_t vested_amount(
      const vestry::schema::account_id_t& recipient) const;
  vestry::schema::query_result_t claimable_amount(
      const vestry::schema::account_id_t& recipient) const;

  std::optional<vestry::schema::timestamp_seconds_t> claim_start_time(
      const vestry::schema::account_id_t& recipient) const;
  bool can_claim(const vestry::schema::account_id_t& recipient) const;

  /// Copy of the escrow totals, lifecycle and seized set.
  vestry::schema::escrow_state_t escrow() const;

  /// Configuration as constructed. The live safe address is in `escrow()`.
  const vestry::schema::escrow_config_t& config() const { return config_; }

 private:
  template <typename Operation>
  vestry::schema::operation_result_t mutate(std::string_view name,
                                            Operation&& operation);

  template <typename Valuation>
  vestry::schema::query_result_t value(
      const vestry::schema::account_id_t& recipient,
      Valuation&& valuation) const;

  // Move the rollback point of the running mutation to the current ledger.
  void commit_progress();

  bool is_administrator(const vestry::schema::account_id_t& caller) const;

  mutable std::recursive_mutex mutex_;
  vestry::schema::escrow_config_t config_;
  funds_adapter_t funds_;
  authorizer_t is_administrator_;
  time_source_t clock_;
  escrow_ledger ledger_;
  std::optional<escrow_ledger> checkpoint_;
  bool mutation_in_flight_{false};
};

}  // namespace vestry::execution
