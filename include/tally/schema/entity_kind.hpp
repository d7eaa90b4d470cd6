#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entity kind.
// Remote object families that carry mutable fields.
namespace tally::schema {

enum class entity_kind_t : uint8_t {
  transaction = 0,
  category = 1,
  tag = 2,
  recurring = 3
};

inline constexpr auto kEntityKindMappings =
    std::array{std::pair<std::string_view, entity_kind_t>{
                   "transaction", entity_kind_t::transaction},
               std::pair<std::string_view, entity_kind_t>{
                   "category", entity_kind_t::category},
               std::pair<std::string_view, entity_kind_t>{"tag",
                                                          entity_kind_t::tag},
               std::pair<std::string_view, entity_kind_t>{
                   "recurring", entity_kind_t::recurring}};

template <>
inline std::optional<entity_kind_t> try_from_string<entity_kind_t>(
    const std::string_view value) {
  return from_string(value, kEntityKindMappings);
}

inline constexpr std::string_view to_string(const entity_kind_t value) {
  return to_string(value, kEntityKindMappings).value_or("unknown");
}

}  // namespace tally::schema
