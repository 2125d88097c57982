#pragma once

#include <vestry/execution/engine.hpp>
#include <vestry/ledger/token_ledger.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/testing/common.hpp>

#include <functional>
#include <utility>

namespace vestry::testing {

/// Engine wired to an in-memory token ledger and a settable clock.
///
/// Schedules in the tests start at kStart; the clock starts just before it so
/// that freshly added schedules have a future start time.
class escrow_fixture final {
 public:
  static constexpr vestry::schema::timestamp_seconds_t kStart = 1'000'000;

  using push_hook_t =
      std::function<void(const vestry::schema::account_id_t& to,
                         const vestry::schema::amount_t& amount)>;

  explicit escrow_fixture(const bool allow_past_start_time = false)
      : engine_{make_config(allow_past_start_time), make_adapter(),
                [this](const vestry::schema::account_id_t& caller) {
                  return caller == admin_;
                },
                [this] { return now_; }} {}

  escrow_fixture(const escrow_fixture&) = delete;
  escrow_fixture& operator=(const escrow_fixture&) = delete;
  escrow_fixture(escrow_fixture&&) = delete;
  escrow_fixture& operator=(escrow_fixture&&) = delete;

  vestry::execution::engine& engine() { return engine_; }
  vestry::ledger::token_ledger& tokens() { return tokens_; }

  const vestry::schema::account_id_t& admin() const { return admin_; }
  const vestry::schema::account_id_t& escrow_account() const {
    return escrow_account_;
  }
  const vestry::schema::account_id_t& safe() const { return safe_; }

  void set_now(const vestry::schema::timestamp_seconds_t now) { now_ = now; }
  vestry::schema::timestamp_seconds_t now() const { return now_; }

  /// Give the administrator `amount` tokens and approve the escrow for them.
  void fund_admin(const vestry::schema::amount_t& amount) {
    tokens_.mint(admin_, amount);
    tokens_.approve(admin_, escrow_account_,
                    tokens_.allowance(admin_, escrow_account_) + amount);
  }

  /// Fund and add one schedule; returns the engine result.
  vestry::schema::operation_result_t add_recipient(
      const vestry::schema::account_id_t& recipient,
      const vestry::schema::amount_t& amount,
      const vestry::schema::timestamp_seconds_t start_time,
      const vestry::schema::timestamp_seconds_t end_time,
      const vestry::schema::duration_seconds_t cliff_duration) {
    fund_admin(amount);
    return engine_.add_recipients(
        admin_,
        make_batch(recipient, amount, start_time, end_time, cliff_duration));
  }

  void fail_pull(const bool fail) { fail_pull_ = fail; }
  void fail_push(const bool fail) { fail_push_ = fail; }
  void on_push(push_hook_t hook) { on_push_ = std::move(hook); }

 private:
  vestry::schema::escrow_config_t make_config(
      const bool allow_past_start_time) const {
    return vestry::schema::escrow_config_t{
        .version = 1,
        .safe_address = safe_,
        .allow_past_start_time = allow_past_start_time};
  }

  vestry::execution::funds_adapter_t make_adapter() {
    auto inner = tokens_.make_adapter(escrow_account_);
    return vestry::execution::funds_adapter_t{
        .pull =
            [this, inner](const vestry::schema::account_id_t& from,
                          const vestry::schema::amount_t& amount) {
              if (fail_pull_) {
                return false;
              }
              return inner.pull(from, amount);
            },
        .push =
            [this, inner](const vestry::schema::account_id_t& to,
                          const vestry::schema::amount_t& amount) {
              if (on_push_) {
                on_push_(to, amount);
              }
              if (fail_push_) {
                return false;
              }
              return inner.push(to, amount);
            }};
  }

  vestry::schema::account_id_t admin_{make_account(0x10)};
  vestry::schema::account_id_t escrow_account_{make_account(0x20)};
  vestry::schema::account_id_t safe_{make_account(0x30)};
  vestry::schema::timestamp_seconds_t now_{kStart - 10};
  bool fail_pull_{false};
  bool fail_push_{false};
  push_hook_t on_push_;
  vestry::ledger::token_ledger tokens_;
  vestry::execution::engine engine_;
};

}  // namespace vestry::testing
