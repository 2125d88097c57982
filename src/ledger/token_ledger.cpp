#include <spdlog/spdlog.h>
#include <vestry/ledger/token_ledger.hpp>

#include <iterator>

using namespace vestry::schema;

namespace vestry::ledger {

void token_ledger::mint(const account_id_t& to, const amount_t& amount) {
  balances_[to] += amount;
  spdlog::debug("Minted {} to {}", amount.str(), to_hex(to));
}

amount_t token_ledger::balance_of(const account_id_t& owner) const {
  auto it = balances_.find(owner);
  if (it == std::end(balances_)) {
    return amount_t{0};
  }
  return it->second;
}

amount_t token_ledger::allowance(const account_id_t& owner,
                                 const account_id_t& spender) const {
  auto it = allowances_.find(std::make_pair(owner, spender));
  if (it == std::end(allowances_)) {
    return amount_t{0};
  }
  return it->second;
}

void token_ledger::approve(const account_id_t& owner,
                           const account_id_t& spender,
                           const amount_t& amount) {
  allowances_[std::make_pair(owner, spender)] = amount;
}

bool token_ledger::transfer(const account_id_t& from,
                            const account_id_t& to,
                            const amount_t& amount) {
  auto available = balance_of(from);
  if (available < amount) {
    spdlog::warn("Transfer of {} from {} rejected; balance is {}",
                 amount.str(), to_hex(from), available.str());
    return false;
  }
  balances_[from] = available - amount;
  balances_[to] += amount;
  return true;
}

bool token_ledger::transfer_from(const account_id_t& spender,
                                 const account_id_t& owner,
                                 const account_id_t& to,
                                 const amount_t& amount) {
  auto approved = allowance(owner, spender);
  if (approved < amount) {
    spdlog::warn("Transfer of {} by {} rejected; allowance is {}",
                 amount.str(), to_hex(spender), approved.str());
    return false;
  }
  if (!transfer(owner, to, amount)) {
    return false;
  }
  allowances_[std::make_pair(owner, spender)] = approved - amount;
  return true;
}

vestry::execution::funds_adapter_t token_ledger::make_adapter(
    const account_id_t& escrow_account) {
  return vestry::execution::funds_adapter_t{
      .pull =
          [this, escrow_account](const account_id_t& from,
                                 const amount_t& amount) {
            return transfer_from(escrow_account, from, escrow_account, amount);
          },
      .push =
          [this, escrow_account](const account_id_t& to,
                                 const amount_t& amount) {
            return transfer(escrow_account, to, amount);
          }};
}

}  // namespace vestry::ledger
