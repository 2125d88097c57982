#pragma once

#include <vestry/schema/error_code.hpp>
#include <vestry/schema/operation_event.hpp>
#include <vestry/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vestry::schema {

inline constexpr auto kEscrowCodespace = std::string_view{"vestry.escrow"};
inline constexpr auto kQueryCodespace = std::string_view{"vestry.query"};

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<operation_event_t> events;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

template <uint16_t Version>
struct query_result;

/// Read-path result. `value` is only meaningful when `code == 0`.
template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  amount_t value{};

  bool ok() const { return code == 0; }
};

using query_result_t = query_result<1>;

}  // namespace vestry::schema
