#pragma once

#include <vestry/execution/collaborators.hpp>
#include <vestry/schema/primitives.hpp>

#include <map>
#include <utility>

namespace vestry::ledger {

/// In-memory fungible token: balances and spending allowances.
///
/// Transfers are all-or-nothing and return false when the sender balance or
/// the spender allowance is too small. Used as the funds adapter behind an
/// escrow in tests and tooling.
class token_ledger final {
 public:
  void mint(const vestry::schema::account_id_t& to,
            const vestry::schema::amount_t& amount);

  vestry::schema::amount_t balance_of(
      const vestry::schema::account_id_t& owner) const;
  vestry::schema::amount_t allowance(
      const vestry::schema::account_id_t& owner,
      const vestry::schema::account_id_t& spender) const;

  /// Set (not add to) what `spender` may move out of `owner`.
  void approve(const vestry::schema::account_id_t& owner,
               const vestry::schema::account_id_t& spender,
               const vestry::schema::amount_t& amount);

  bool transfer(const vestry::schema::account_id_t& from,
                const vestry::schema::account_id_t& to,
                const vestry::schema::amount_t& amount);

  /// Move `amount` from `owner` to `to` on behalf of `spender`, consuming
  /// allowance.
  bool transfer_from(const vestry::schema::account_id_t& spender,
                     const vestry::schema::account_id_t& owner,
                     const vestry::schema::account_id_t& to,
                     const vestry::schema::amount_t& amount);

  /// Adapter for an escrow holding its tokens at `escrow_account`.
  ///
  /// `pull` spends the funder's allowance to the escrow account, `push` pays
  /// out of the escrow account's balance. The ledger must outlive the
  /// adapter.
  vestry::execution::funds_adapter_t make_adapter(
      const vestry::schema::account_id_t& escrow_account);

 private:
  std::map<vestry::schema::account_id_t, vestry::schema::amount_t> balances_;
  std::map<std::pair<vestry::schema::account_id_t,
                     vestry::schema::account_id_t>,
           vestry::schema::amount_t>
      allowances_;
};

}  // namespace vestry::ledger
