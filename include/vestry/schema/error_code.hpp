#pragma once

#include <vestry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace vestry::schema {

enum class error_code : uint32_t {
  unauthorized = 1,
  invalid_address = 2,
  invalid_schedule = 3,
  state_conflict = 4,
  escrow_terminated = 5,
  escrow_not_terminated = 6,
  claim_exceeds_entitlement = 7,
  insufficient_funds = 8,
  recipient_missing = 9,
  invalid_amount = 10,
  arithmetic_fault = 11,
  reentrant_call = 12,
};

template <>
struct enum_traits<error_code> final {
  static constexpr auto mappings = std::array{
      enum_mapping_t<error_code>{"unauthorized", error_code::unauthorized},
      enum_mapping_t<error_code>{"invalid_address", error_code::invalid_address},
      enum_mapping_t<error_code>{"invalid_schedule",
                                 error_code::invalid_schedule},
      enum_mapping_t<error_code>{"state_conflict", error_code::state_conflict},
      enum_mapping_t<error_code>{"escrow_terminated",
                                 error_code::escrow_terminated},
      enum_mapping_t<error_code>{"escrow_not_terminated",
                                 error_code::escrow_not_terminated},
      enum_mapping_t<error_code>{"claim_exceeds_entitlement",
                                 error_code::claim_exceeds_entitlement},
      enum_mapping_t<error_code>{"insufficient_funds",
                                 error_code::insufficient_funds},
      enum_mapping_t<error_code>{"recipient_missing",
                                 error_code::recipient_missing},
      enum_mapping_t<error_code>{"invalid_amount", error_code::invalid_amount},
      enum_mapping_t<error_code>{"arithmetic_fault",
                                 error_code::arithmetic_fault},
      enum_mapping_t<error_code>{"reentrant_call", error_code::reentrant_call}};
};

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace vestry::schema
