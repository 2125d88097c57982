#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation event.
// Vesting workflow: emitted by every successful mutation so indexers can
// follow schedules and fund movements without polling state.
namespace vestry::schema {

template <uint16_t Version>
struct operation_event_attribute;

template <>
struct operation_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using operation_event_attribute_t = operation_event_attribute<1>;

template <uint16_t Version>
struct operation_event;

template <>
struct operation_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<operation_event_attribute_t> attributes;
};

using operation_event_t = operation_event<1>;

}  // namespace vestry::schema
