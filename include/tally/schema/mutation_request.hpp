#pragma once

#include <tally/schema/entity_kind.hpp>
#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: mutation request.
// One entity kind, an ordered list of target ids, and the desired value per
// field. Add/remove only apply to id-set fields and are resolved against the
// captured current value.
namespace tally::schema {

enum class update_mode_t : uint8_t { set = 0, add = 1, remove = 2 };

inline constexpr auto kUpdateModeMappings = std::array{
    std::pair<std::string_view, update_mode_t>{"set", update_mode_t::set},
    std::pair<std::string_view, update_mode_t>{"add", update_mode_t::add},
    std::pair<std::string_view, update_mode_t>{"remove", update_mode_t::remove}};

template <>
inline std::optional<update_mode_t> try_from_string<update_mode_t>(
    const std::string_view value) {
  return from_string(value, kUpdateModeMappings);
}

inline constexpr std::string_view to_string(const update_mode_t value) {
  return to_string(value, kUpdateModeMappings).value_or("unknown");
}

struct field_update final {
  field_t field{};
  update_mode_t mode{update_mode_t::set};
  optional_field_value_t value;
};

struct mutation_request final {
  entity_kind_t kind{};
  std::vector<std::string> ids;
  std::vector<field_update> updates;
};

inline field_update set_field(const field_t field,
                              optional_field_value_t value) {
  return field_update{
      .field = field, .mode = update_mode_t::set, .value = std::move(value)};
}

}  // namespace tally::schema
