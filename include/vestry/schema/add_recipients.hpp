#pragma once
#include <vestry/schema/primitives.hpp>

#include <vector>

// Schema type: add recipients.
// Vesting workflow: one funding batch. The arrays are parallel; entry i of
// every array describes the same recipient.
namespace vestry::schema {

template <uint16_t Version>
struct add_recipients;

template <>
struct add_recipients<1> final {
  uint16_t version{1};
  std::vector<account_id_t> recipients;
  std::vector<amount_t> amounts;
  std::vector<timestamp_seconds_t> start_times;
  std::vector<timestamp_seconds_t> end_times;
  std::vector<duration_seconds_t> cliff_durations;
  amount_t total_funding{};
};

using add_recipients_t = add_recipients<1>;

}  // namespace vestry::schema
