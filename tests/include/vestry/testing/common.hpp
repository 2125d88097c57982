#pragma once

#include <vestry/schema/add_recipients.hpp>
#include <vestry/schema/primitives.hpp>

#include <cstdint>
#include <vector>

namespace vestry::testing {

inline vestry::schema::account_id_t make_account(const uint8_t seed) {
  auto out = vestry::schema::account_id_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Batch with a single entry funded exactly.
inline vestry::schema::add_recipients_t make_batch(
    const vestry::schema::account_id_t& recipient,
    const vestry::schema::amount_t& amount,
    const vestry::schema::timestamp_seconds_t start_time,
    const vestry::schema::timestamp_seconds_t end_time,
    const vestry::schema::duration_seconds_t cliff_duration) {
  return vestry::schema::add_recipients_t{
      .version = 1,
      .recipients = {recipient},
      .amounts = {amount},
      .start_times = {start_time},
      .end_times = {end_time},
      .cliff_durations = {cliff_duration},
      .total_funding = amount};
}

}  // namespace vestry::testing
