#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entry state.
// Undo eligibility of one journaled field.
namespace tally::schema {

enum class entry_state_t : uint8_t { applied = 0, undone = 1, superseded = 2 };

inline constexpr auto kEntryStateMappings =
    std::array{std::pair<std::string_view, entry_state_t>{
                   "applied", entry_state_t::applied},
               std::pair<std::string_view, entry_state_t>{
                   "undone", entry_state_t::undone},
               std::pair<std::string_view, entry_state_t>{
                   "superseded", entry_state_t::superseded}};

template <>
inline std::optional<entry_state_t> try_from_string<entry_state_t>(
    const std::string_view value) {
  return from_string(value, kEntryStateMappings);
}

inline constexpr std::string_view to_string(const entry_state_t value) {
  return to_string(value, kEntryStateMappings).value_or("unknown");
}

enum class entry_origin_t : uint8_t {
  mutation = 0,
  journal_undo = 1,
  native_undo = 2
};

inline constexpr auto kEntryOriginMappings =
    std::array{std::pair<std::string_view, entry_origin_t>{
                   "mutation", entry_origin_t::mutation},
               std::pair<std::string_view, entry_origin_t>{
                   "undo", entry_origin_t::journal_undo},
               std::pair<std::string_view, entry_origin_t>{
                   "native-undo", entry_origin_t::native_undo}};

inline constexpr std::string_view to_string(const entry_origin_t value) {
  return to_string(value, kEntryOriginMappings).value_or("unknown");
}

}  // namespace tally::schema
