#include <spdlog/spdlog.h>
#include <vestry/execution/escrow_ledger.hpp>

#include <utility>

using namespace vestry::schema;

namespace vestry::execution {

escrow_ledger::escrow_ledger(const account_id_t& safe_address) {
  state_.safe_address = safe_address;
}

const recipient_state_t* escrow_ledger::find(
    const account_id_t& recipient) const {
  auto it = recipients_.find(recipient);
  if (it == std::end(recipients_)) {
    return nullptr;
  }
  return &it->second;
}

recipient_state_t* escrow_ledger::find(const account_id_t& recipient) {
  auto it = recipients_.find(recipient);
  if (it == std::end(recipients_)) {
    return nullptr;
  }
  return &it->second;
}

bool escrow_ledger::contains(const account_id_t& recipient) const {
  return recipients_.contains(recipient);
}

ledger_outcome_t escrow_ledger::allocate(const recipient_state_t& recipient) {
  if (contains(recipient.recipient)) {
    return ledger_violation{.code = error_code::state_conflict,
                            .reason = "recipient already has a schedule"};
  }
  if (recipient.total_claimed != 0) {
    return ledger_violation{.code = error_code::invalid_schedule,
                            .reason = "new schedule must start unclaimed"};
  }
  state_.total_allocated_supply += recipient.total_vesting_amount;
  recipients_.emplace(recipient.recipient, recipient);
  return std::nullopt;
}

void escrow_ledger::add_dust(const amount_t& amount) {
  state_.dust += amount;
}

amount_t escrow_ledger::take_dust() {
  return std::exchange(state_.dust, amount_t{0});
}

ledger_outcome_t escrow_ledger::record_claim(const account_id_t& recipient,
                                             const amount_t& amount) {
  auto* entry = find(recipient);
  if (entry == nullptr) {
    return ledger_violation{.code = error_code::recipient_missing,
                            .reason = "recipient has no schedule"};
  }
  auto recipient_claimed = entry->total_claimed + amount;
  if (recipient_claimed > entry->total_vesting_amount) {
    return ledger_violation{
        .code = error_code::claim_exceeds_entitlement,
        .reason = "recipient claimed total would exceed its vesting amount"};
  }
  auto escrow_claimed = state_.total_claimed + amount;
  if (escrow_claimed > state_.total_allocated_supply) {
    return ledger_violation{
        .code = error_code::claim_exceeds_entitlement,
        .reason = "escrow claimed total would exceed allocated supply"};
  }
  if (escrow_claimed + state_.total_seized > state_.total_allocated_supply) {
    return ledger_violation{
        .code = error_code::claim_exceeds_entitlement,
        .reason = "claimed and seized totals would exceed allocated supply"};
  }
  entry->total_claimed = recipient_claimed;
  state_.total_claimed = escrow_claimed;
  return std::nullopt;
}

ledger_outcome_t escrow_ledger::record_seizure(const amount_t& amount) {
  auto seized = state_.total_seized + amount;
  if (state_.total_claimed + seized > state_.total_allocated_supply) {
    return ledger_violation{
        .code = error_code::claim_exceeds_entitlement,
        .reason = "claimed and seized totals would exceed allocated supply"};
  }
  state_.total_seized = seized;
  return std::nullopt;
}

bool escrow_ledger::mark_seized(const account_id_t& recipient) {
  return state_.seized.insert(recipient).second;
}

bool escrow_ledger::is_seized(const account_id_t& recipient) const {
  return state_.seized.contains(recipient);
}

ledger_outcome_t escrow_ledger::terminate(const timestamp_seconds_t now) {
  if (is_terminated(state_.lifecycle)) {
    return ledger_violation{.code = error_code::escrow_terminated,
                            .reason = "escrow is already terminated"};
  }
  state_.lifecycle = escrow_terminated_t{.terminated_at = now};
  return std::nullopt;
}

void escrow_ledger::set_safe_address(const account_id_t& safe_address) {
  state_.safe_address = safe_address;
}

ledger_outcome_t escrow_ledger::check_invariants() const {
  auto allocated = amount_t{0};
  auto claimed = amount_t{0};
  for (const auto& [account, recipient] : recipients_) {
    if (recipient.total_claimed > recipient.total_vesting_amount) {
      spdlog::error("Recipient {} claimed {} of {}", to_hex(account),
                    recipient.total_claimed.str(),
                    recipient.total_vesting_amount.str());
      return ledger_violation{
          .code = error_code::claim_exceeds_entitlement,
          .reason = "recipient claimed total exceeds its vesting amount"};
    }
    allocated += recipient.total_vesting_amount;
    claimed += recipient.total_claimed;
  }
  if (allocated != state_.total_allocated_supply) {
    return ledger_violation{
        .code = error_code::arithmetic_fault,
        .reason = "allocated supply does not match recipient totals"};
  }
  if (claimed != state_.total_claimed) {
    return ledger_violation{
        .code = error_code::arithmetic_fault,
        .reason = "escrow claimed total does not match recipient claims"};
  }
  if (state_.total_claimed + state_.total_seized >
      state_.total_allocated_supply) {
    return ledger_violation{
        .code = error_code::claim_exceeds_entitlement,
        .reason = "claimed and seized totals exceed allocated supply"};
  }
  return std::nullopt;
}

}  // namespace vestry::execution
