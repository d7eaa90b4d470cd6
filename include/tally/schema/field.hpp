#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: field.
// Closed enumeration of every mutable field name across entity kinds. Which
// fields a kind accepts is decided by the change model.
namespace tally::schema {

enum class field_t : uint8_t {
  reviewed = 0,
  category_id = 1,
  tags = 2,
  notes = 3,
  recurring_id = 4,
  transaction_type = 5,
  name = 10,
  emoji = 11,
  color_name = 12,
  excluded = 13,
  name_contains = 20,
  min_amount = 21,
  max_amount = 22,
  frequency = 23
};

inline constexpr auto kFieldMappings = std::array{
    std::pair<std::string_view, field_t>{"reviewed", field_t::reviewed},
    std::pair<std::string_view, field_t>{"category_id", field_t::category_id},
    std::pair<std::string_view, field_t>{"tags", field_t::tags},
    std::pair<std::string_view, field_t>{"notes", field_t::notes},
    std::pair<std::string_view, field_t>{"recurring_id", field_t::recurring_id},
    std::pair<std::string_view, field_t>{"type", field_t::transaction_type},
    std::pair<std::string_view, field_t>{"name", field_t::name},
    std::pair<std::string_view, field_t>{"emoji", field_t::emoji},
    std::pair<std::string_view, field_t>{"color_name", field_t::color_name},
    std::pair<std::string_view, field_t>{"excluded", field_t::excluded},
    std::pair<std::string_view, field_t>{"name_contains",
                                         field_t::name_contains},
    std::pair<std::string_view, field_t>{"min_amount", field_t::min_amount},
    std::pair<std::string_view, field_t>{"max_amount", field_t::max_amount},
    std::pair<std::string_view, field_t>{"frequency", field_t::frequency}};

template <>
inline std::optional<field_t> try_from_string<field_t>(
    const std::string_view value) {
  return from_string(value, kFieldMappings);
}

inline constexpr std::string_view to_string(const field_t value) {
  return to_string(value, kFieldMappings).value_or("unknown");
}

}  // namespace tally::schema
