#pragma once

#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>

#include <cstdint>

// Schema type: field change.
// One applied field write: the value captured immediately before the write and
// the value written.
namespace tally::schema {

template <uint16_t Version>
struct field_change;

template <>
struct field_change<1> final {
  uint16_t version{1};
  field_t field{};
  optional_field_value_t old_value;
  optional_field_value_t new_value;

  bool operator==(const field_change&) const = default;
};

using field_change_t = field_change<1>;

}  // namespace tally::schema
