#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vestry::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

/// Name table for an enum. Specialise with a `static constexpr` array named
/// `mappings` of enum_mapping_t entries.
template <typename Enum>
struct enum_traits;

template <typename Enum, typename = std::enable_if_t<std::is_enum_v<Enum>>>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_traits<Enum>::mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, typename = std::enable_if_t<std::is_enum_v<Enum>>>
constexpr std::string_view to_string(const Enum value) {
  for (const auto& [name, enum_value] : enum_traits<Enum>::mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace vestry::schema
