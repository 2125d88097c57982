#include <spdlog/spdlog.h>
#include <vestry/common/critical.hpp>
#include <vestry/execution/engine.hpp>
#include <vestry/vesting/lifecycle.hpp>
#include <vestry/vesting/schedule.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using namespace vestry::schema;

namespace {

struct in_flight_guard final {
  explicit in_flight_guard(bool& flag) : flag_{flag} { flag_ = true; }
  ~in_flight_guard() { flag_ = false; }

  in_flight_guard(const in_flight_guard&) = delete;
  in_flight_guard& operator=(const in_flight_guard&) = delete;

 private:
  bool& flag_;
};

operation_result_t make_error(const error_code code,
                              std::string log,
                              std::string info = {}) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

operation_result_t make_error(const vestry::execution::ledger_violation& violation,
                              std::string info = {}) {
  return make_error(violation.code, violation.reason, std::move(info));
}

operation_result_t make_success(std::string info,
                                std::vector<operation_event_t> events) {
  auto result = operation_result_t{};
  result.code = 0;
  result.info = std::move(info);
  result.events = std::move(events);
  return result;
}

operation_event_attribute_t make_attribute(std::string key,
                                           std::string value,
                                           const bool index = false) {
  return operation_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

operation_event_attribute_t make_attribute(std::string key,
                                           const account_id_t& account) {
  return make_attribute(std::move(key), to_hex(account), true);
}

operation_event_attribute_t make_attribute(std::string key,
                                           const amount_t& amount) {
  return make_attribute(std::move(key), amount.str());
}

operation_event_attribute_t make_attribute(std::string key,
                                           const uint64_t value) {
  return make_attribute(std::move(key), std::to_string(value));
}

operation_event_t make_event(
    std::string type,
    std::vector<operation_event_attribute_t> attributes) {
  return operation_event_t{.type = std::move(type),
                           .attributes = std::move(attributes)};
}

std::string describe(const recipient_state_t& recipient) {
  return to_hex(recipient.recipient) + " is " +
         std::string{to_string(recipient.status)};
}

}  // namespace

namespace vestry::execution {

engine::engine(const escrow_config_t& config,
               funds_adapter_t funds,
               authorizer_t is_administrator,
               time_source_t clock)
    : config_{config},
      funds_{std::move(funds)},
      is_administrator_{std::move(is_administrator)},
      clock_{std::move(clock)},
      ledger_{config.safe_address} {
  if (!funds_.pull || !funds_.push) {
    vestry::common::critical("Vesting escrow requires a funds adapter");
  }
  if (!is_administrator_) {
    vestry::common::critical("Vesting escrow requires an authorizer");
  }
  if (!clock_) {
    vestry::common::critical("Vesting escrow requires a time source");
  }
  if (is_zero_account(config_.safe_address)) {
    vestry::common::critical("Vesting escrow safe address must not be zero");
  }
  spdlog::info("Vesting escrow ready; safe address {}, past start times {}",
               to_hex(config_.safe_address),
               config_.allow_past_start_time ? "allowed" : "rejected");
}

template <typename Operation>
operation_result_t engine::mutate(const std::string_view name,
                                  Operation&& operation) {
  auto lock = std::scoped_lock{mutex_};
  if (mutation_in_flight_) {
    spdlog::warn("Rejecting re-entrant {} during an in-flight operation",
                 name);
    auto result = make_error(error_code::reentrant_call,
                             "another escrow operation is in flight",
                             std::string{name});
    result.codespace = kEscrowCodespace;
    return result;
  }
  auto guard = in_flight_guard{mutation_in_flight_};
  checkpoint_ = ledger_;
  auto now = clock_();

  auto result = operation_result_t{};
  try {
    result = operation(now);
    if (result.ok()) {
      if (auto violation = ledger_.check_invariants()) {
        result = make_error(*violation, "post-operation invariant check");
      }
    }
  } catch (const std::range_error& ex) {
    result = make_error(error_code::arithmetic_fault, "arithmetic underflow",
                        ex.what());
  } catch (const std::overflow_error& ex) {
    result = make_error(error_code::arithmetic_fault, "arithmetic overflow",
                        ex.what());
  } catch (...) {
    ledger_ = std::move(*checkpoint_);
    checkpoint_.reset();
    throw;
  }

  result.codespace = kEscrowCodespace;
  if (!result.ok()) {
    ledger_ = std::move(*checkpoint_);
    spdlog::warn("{} rejected with {}: {} {}", name,
                 to_string(static_cast<error_code>(result.code)), result.log,
                 result.info);
  }
  checkpoint_.reset();
  return result;
}

void engine::commit_progress() {
  checkpoint_ = ledger_;
}

template <typename Valuation>
query_result_t engine::value(const account_id_t& recipient,
                             Valuation&& valuation) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.codespace = kQueryCodespace;

  const auto* entry = ledger_.find(recipient);
  if (entry == nullptr) {
    result.code = to_code(error_code::recipient_missing);
    result.log = "recipient has no schedule";
    return result;
  }
  try {
    auto amount = valuation(*entry, clock_(), ledger_.state().lifecycle);
    if (!amount) {
      result.code = to_code(error_code::state_conflict);
      result.log = "recipient is terminated";
      return result;
    }
    result.value = *amount;
  } catch (const std::range_error& ex) {
    result.code = to_code(error_code::arithmetic_fault);
    result.log = ex.what();
  } catch (const std::overflow_error& ex) {
    result.code = to_code(error_code::arithmetic_fault);
    result.log = ex.what();
  }
  return result;
}

bool engine::is_administrator(const account_id_t& caller) const {
  return is_administrator_(caller);
}

operation_result_t engine::add_recipients(const account_id_t& caller,
                                          const add_recipients_t& batch) {
  return mutate("add_recipients", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (is_terminated(ledger_.state().lifecycle)) {
      return make_error(error_code::escrow_terminated,
                        "escrow is terminated");
    }
    auto count = batch.recipients.size();
    if (count == 0) {
      return make_error(error_code::invalid_schedule,
                        "batch must contain at least one recipient");
    }
    if (batch.amounts.size() != count || batch.start_times.size() != count ||
        batch.end_times.size() != count ||
        batch.cliff_durations.size() != count) {
      return make_error(error_code::invalid_schedule,
                        "batch arrays must have equal length");
    }
    if (batch.total_funding == 0) {
      return make_error(error_code::invalid_schedule,
                        "total funding must be greater than zero");
    }

    auto seen = std::set<account_id_t>{};
    auto allocated = amount_t{0};
    auto events = std::vector<operation_event_t>{};
    events.reserve(count + 1);
    for (std::size_t i = 0; i < count; ++i) {
      const auto& account = batch.recipients[i];
      auto entry = "entry " + std::to_string(i);
      if (is_zero_account(account)) {
        return make_error(error_code::invalid_address,
                          "recipient address must not be zero", entry);
      }
      if (!seen.insert(account).second) {
        return make_error(error_code::state_conflict,
                          "recipient appears twice in the batch",
                          to_hex(account));
      }
      auto terms = vesting::schedule_terms{
          .total_vesting_amount = batch.amounts[i],
          .start_time = batch.start_times[i],
          .end_time = batch.end_times[i],
          .cliff_duration = batch.cliff_durations[i]};
      if (auto reason = vesting::validate_terms(
              terms, now, config_.allow_past_start_time)) {
        return make_error(error_code::invalid_schedule, std::string{*reason},
                          entry);
      }

      auto recipient = vesting::make_recipient_state(account, terms);
      if (auto violation = ledger_.allocate(recipient)) {
        return make_error(*violation, to_hex(account));
      }
      allocated += terms.total_vesting_amount;
      events.push_back(make_event(
          "recipient_added",
          {make_attribute("recipient", account),
           make_attribute("amount", terms.total_vesting_amount),
           make_attribute("start_time", terms.start_time),
           make_attribute("end_time", terms.end_time),
           make_attribute("cliff_duration", terms.cliff_duration),
           make_attribute("vesting_per_second",
                          recipient.vesting_per_second)}));
    }
    if (allocated > batch.total_funding) {
      return make_error(error_code::invalid_schedule,
                        "allocated amounts exceed total funding",
                        allocated.str() + " > " + batch.total_funding.str());
    }
    auto dust = batch.total_funding - allocated;
    ledger_.add_dust(dust);

    if (!funds_.pull(caller, batch.total_funding)) {
      return make_error(error_code::insufficient_funds,
                        "failed to pull funding from caller",
                        batch.total_funding.str());
    }

    events.push_back(make_event(
        "recipients_funded",
        {make_attribute("funder", caller),
         make_attribute("total_funding", batch.total_funding),
         make_attribute("allocated", allocated),
         make_attribute("dust", dust),
         make_attribute("count", static_cast<uint64_t>(count))}));
    spdlog::info("Funded {} recipient(s) with {} ({} allocated, {} dust)",
                 count, batch.total_funding.str(), allocated.str(),
                 dust.str());
    return make_success("add_recipients accepted", std::move(events));
  });
}

operation_result_t engine::pause(const account_id_t& caller,
                                 const account_id_t& recipient) {
  return mutate("pause", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (is_terminated(ledger_.state().lifecycle)) {
      return make_error(error_code::escrow_terminated,
                        "escrow is terminated");
    }
    auto* entry = ledger_.find(recipient);
    if (entry == nullptr) {
      return make_error(error_code::recipient_missing,
                        "recipient has no schedule", to_hex(recipient));
    }
    if (!vesting::pause(*entry, now)) {
      return make_error(error_code::state_conflict,
                        "only an unpaused recipient can be paused",
                        describe(*entry));
    }
    spdlog::info("Paused recipient {} at {}", to_hex(recipient), now);
    return make_success(
        "pause accepted",
        {make_event("recipient_paused",
                    {make_attribute("recipient", recipient),
                     make_attribute("paused_at", now)})});
  });
}

operation_result_t engine::unpause(const account_id_t& caller,
                                   const account_id_t& recipient) {
  return mutate("unpause", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    auto* entry = ledger_.find(recipient);
    if (entry == nullptr) {
      return make_error(error_code::recipient_missing,
                        "recipient has no schedule", to_hex(recipient));
    }
    auto paused_for =
        vesting::unpause(*entry, now, ledger_.state().lifecycle);
    if (!paused_for) {
      return make_error(error_code::state_conflict,
                        "only a paused recipient can be unpaused",
                        describe(*entry));
    }
    spdlog::info("Unpaused recipient {} after {}s; end time now {}",
                 to_hex(recipient), *paused_for, entry->end_time);
    return make_success(
        "unpause accepted",
        {make_event("recipient_unpaused",
                    {make_attribute("recipient", recipient),
                     make_attribute("paused_for", *paused_for),
                     make_attribute("end_time", entry->end_time),
                     make_attribute("cliff_duration",
                                    entry->cliff_duration)})});
  });
}

operation_result_t engine::terminate_recipient(const account_id_t& caller,
                                               const account_id_t& recipient) {
  return mutate("terminate_recipient", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (is_terminated(ledger_.state().lifecycle)) {
      return make_error(error_code::escrow_terminated,
                        "escrow is terminated");
    }
    auto* entry = ledger_.find(recipient);
    if (entry == nullptr) {
      return make_error(error_code::recipient_missing,
                        "recipient has no schedule", to_hex(recipient));
    }
    auto claimable =
        vesting::claimable_amount(*entry, now, ledger_.state().lifecycle);
    if (!claimable) {
      return make_error(error_code::state_conflict,
                        "recipient is already terminated", describe(*entry));
    }
    // The payout leg is final once the recipient holds the tokens; a failed
    // sweep only rolls back to this point.
    if (*claimable > 0) {
      if (auto violation = ledger_.record_claim(recipient, *claimable)) {
        return make_error(*violation, to_hex(recipient));
      }
      if (!funds_.push(recipient, *claimable)) {
        return make_error(error_code::insufficient_funds,
                          "failed to pay claimable amount to recipient",
                          claimable->str());
      }
      commit_progress();
    }

    auto remaining = entry->total_vesting_amount - entry->total_claimed;
    if (auto violation = ledger_.record_seizure(remaining)) {
      return make_error(*violation, to_hex(recipient));
    }
    if (!vesting::terminate(*entry)) {
      return make_error(error_code::state_conflict,
                        "recipient cannot be terminated", describe(*entry));
    }

    const auto safe_address = ledger_.state().safe_address;
    if (remaining > 0 && !funds_.push(safe_address, remaining)) {
      return make_error(error_code::insufficient_funds,
                        "failed to sweep remaining entitlement",
                        "paid " + claimable->str() + ", unswept " +
                            remaining.str());
    }
    spdlog::info("Terminated recipient {}: paid {}, swept {} to {}",
                 to_hex(recipient), claimable->str(), remaining.str(),
                 to_hex(safe_address));
    return make_success(
        "terminate_recipient accepted",
        {make_event("recipient_terminated",
                    {make_attribute("recipient", recipient),
                     make_attribute("paid", *claimable),
                     make_attribute("swept", remaining),
                     make_attribute("safe_address", safe_address)})});
  });
}

operation_result_t engine::terminate_escrow(const account_id_t& caller) {
  return mutate("terminate_escrow", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (auto violation = ledger_.terminate(now)) {
      return make_error(*violation);
    }
    spdlog::info("Escrow terminated at {}", now);
    return make_success(
        "terminate_escrow accepted",
        {make_event("escrow_terminated",
                    {make_attribute("terminated_at", now)})});
  });
}

operation_result_t engine::claim(const account_id_t& caller,
                                 const amount_t& amount) {
  return mutate("claim", [&](const timestamp_seconds_t now) {
    auto* entry = ledger_.find(caller);
    if (entry == nullptr) {
      return make_error(error_code::recipient_missing,
                        "caller has no schedule", to_hex(caller));
    }
    if (entry->status != recipient_status_t::unpaused) {
      return make_error(error_code::state_conflict,
                        "only an unpaused recipient can claim",
                        describe(*entry));
    }
    if (amount == 0) {
      return make_error(error_code::invalid_amount,
                        "claim amount must be greater than zero");
    }
    if (!vesting::can_claim(*entry, now)) {
      return make_error(
          error_code::claim_exceeds_entitlement, "vesting cliff not reached",
          "claims open at " +
              std::to_string(vesting::claim_start_time(*entry)));
    }
    auto claimable =
        vesting::claimable_amount(*entry, now, ledger_.state().lifecycle);
    if (!claimable || amount > *claimable) {
      return make_error(error_code::claim_exceeds_entitlement,
                        "claim amount exceeds claimable amount",
                        amount.str() + " > " +
                            (claimable ? claimable->str() : "0"));
    }
    if (auto violation = ledger_.record_claim(caller, amount)) {
      return make_error(*violation, to_hex(caller));
    }
    if (!funds_.push(caller, amount)) {
      return make_error(error_code::insufficient_funds,
                        "failed to transfer claimed tokens", amount.str());
    }
    spdlog::info("Recipient {} claimed {} ({} of {} claimed)", to_hex(caller),
                 amount.str(), entry->total_claimed.str(),
                 entry->total_vesting_amount.str());
    return make_success(
        "claim accepted",
        {make_event("tokens_claimed",
                    {make_attribute("recipient", caller),
                     make_attribute("amount", amount),
                     make_attribute("total_claimed", entry->total_claimed)})});
  });
}

operation_result_t engine::seize_locked_tokens(
    const account_id_t& caller,
    const std::vector<account_id_t>& recipients) {
  return mutate("seize_locked_tokens", [&](const timestamp_seconds_t now) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (!is_terminated(ledger_.state().lifecycle)) {
      return make_error(error_code::escrow_not_terminated,
                        "escrow must be terminated before seizure");
    }

    auto total = amount_t{0};
    auto seized_count = uint64_t{0};
    for (const auto& account : recipients) {
      const auto* entry = ledger_.find(account);
      if (entry == nullptr ||
          entry->status == recipient_status_t::terminated ||
          ledger_.is_seized(account)) {
        spdlog::debug("Skipping seizure for {}", to_hex(account));
        continue;
      }
      auto locked =
          vesting::locked_amount(*entry, now, ledger_.state().lifecycle);
      if (!locked) {
        continue;
      }
      ledger_.mark_seized(account);
      total += *locked;
      ++seized_count;
    }

    const auto safe_address = ledger_.state().safe_address;
    if (total > 0) {
      if (auto violation = ledger_.record_seizure(total)) {
        return make_error(*violation);
      }
      if (!funds_.push(safe_address, total)) {
        return make_error(error_code::insufficient_funds,
                          "failed to sweep seized tokens", total.str());
      }
    }
    spdlog::info("Seized {} locked from {} recipient(s) to {}", total.str(),
                 seized_count, to_hex(safe_address));
    return make_success(
        "seize_locked_tokens accepted",
        {make_event("locked_tokens_seized",
                    {make_attribute("amount", total),
                     make_attribute("recipients", seized_count),
                     make_attribute("safe_address", safe_address)})});
  });
}

operation_result_t engine::transfer_dust(const account_id_t& caller) {
  return mutate("transfer_dust", [&](const timestamp_seconds_t) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    auto dust = ledger_.take_dust();
    const auto safe_address = ledger_.state().safe_address;
    if (dust > 0 && !funds_.push(safe_address, dust)) {
      return make_error(error_code::insufficient_funds,
                        "failed to transfer dust", dust.str());
    }
    spdlog::info("Transferred {} dust to {}", dust.str(),
                 to_hex(safe_address));
    return make_success(
        "transfer_dust accepted",
        {make_event("dust_transferred",
                    {make_attribute("amount", dust),
                     make_attribute("safe_address", safe_address)})});
  });
}

operation_result_t engine::update_safe_address(
    const account_id_t& caller,
    const account_id_t& safe_address) {
  return mutate("update_safe_address", [&](const timestamp_seconds_t) {
    if (!is_administrator(caller)) {
      return make_error(error_code::unauthorized,
                        "caller is not the administrator");
    }
    if (is_terminated(ledger_.state().lifecycle)) {
      return make_error(error_code::escrow_terminated,
                        "escrow is terminated");
    }
    if (is_zero_account(safe_address)) {
      return make_error(error_code::invalid_address,
                        "safe address must not be zero");
    }
    auto previous = ledger_.state().safe_address;
    ledger_.set_safe_address(safe_address);
    spdlog::info("Safe address changed from {} to {}", to_hex(previous),
                 to_hex(safe_address));
    return make_success(
        "update_safe_address accepted",
        {make_event("safe_address_updated",
                    {make_attribute("previous", previous),
                     make_attribute("safe_address", safe_address)})});
  });
}

std::optional<recipient_state_t> engine::recipient(
    const account_id_t& recipient) const {
  auto lock = std::scoped_lock{mutex_};
  if (const auto* entry = ledger_.find(recipient)) {
    return *entry;
  }
  return std::nullopt;
}

query_result_t engine::locked_amount(const account_id_t& recipient) const {
  return value(recipient, [](const recipient_state_t& entry,
                             const timestamp_seconds_t now,
                             const escrow_lifecycle_t& lifecycle) {
    return vesting::locked_amount(entry, now, lifecycle);
  });
}

query_result_t engine::vested_amount(const account_id_t& recipient) const {
  return value(recipient, [](const recipient_state_t& entry,
                             const timestamp_seconds_t now,
                             const escrow_lifecycle_t& lifecycle) {
    return vesting::vested_amount(entry, now, lifecycle);
  });
}

query_result_t engine::claimable_amount(const account_id_t& recipient) const {
  return value(recipient, [](const recipient_state_t& entry,
                             const timestamp_seconds_t now,
                             const escrow_lifecycle_t& lifecycle) {
    return vesting::claimable_amount(entry, now, lifecycle);
  });
}

std::optional<timestamp_seconds_t> engine::claim_start_time(
    const account_id_t& recipient) const {
  auto lock = std::scoped_lock{mutex_};
  if (const auto* entry = ledger_.find(recipient)) {
    return vesting::claim_start_time(*entry);
  }
  return std::nullopt;
}

bool engine::can_claim(const account_id_t& recipient) const {
  auto lock = std::scoped_lock{mutex_};
  const auto* entry = ledger_.find(recipient);
  return entry != nullptr && vesting::can_claim(*entry, clock_());
}

escrow_state_t engine::escrow() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.state();
}

}  // namespace vestry::execution
