#pragma once

#include <vestry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: recipient status.
// Vesting workflow: unpaused and paused are live states, terminated is final.
namespace vestry::schema {

enum class recipient_status_t : uint8_t {
  unpaused = 0,
  paused = 1,
  terminated = 2
};

template <>
struct enum_traits<recipient_status_t> final {
  static constexpr auto mappings = std::array{
      enum_mapping_t<recipient_status_t>{"unpaused",
                                         recipient_status_t::unpaused},
      enum_mapping_t<recipient_status_t>{"paused", recipient_status_t::paused},
      enum_mapping_t<recipient_status_t>{"terminated",
                                         recipient_status_t::terminated}};
};

}  // namespace vestry::schema
