#pragma once
#include <vestry/schema/primitives.hpp>

namespace vestry::schema {

template <uint16_t Version>
struct escrow_config;

template <>
struct escrow_config<1> final {
  uint16_t version{1};
  account_id_t safe_address{};
  // Accept schedules whose start_time is not in the future (migrations of
  // schedules that already began elsewhere).
  bool allow_past_start_time{false};
};

using escrow_config_t = escrow_config<1>;

}  // namespace vestry::schema
