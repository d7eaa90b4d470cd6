#pragma once

#include <tally/schema/field.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: field value.
// A field holds a boolean, an integer amount (cents), text, or a set of ids.
// An empty optional means the field is unset, which is distinct from every
// concrete value including empty text.
namespace tally::schema {

/// Sorted, de-duplicated list of ids.
using id_set_t = std::vector<std::string>;

using field_value_t = std::variant<bool, int64_t, std::string, id_set_t>;
using optional_field_value_t = std::optional<field_value_t>;

using field_value_map_t = std::map<field_t, optional_field_value_t>;

enum class value_type_t : uint8_t { boolean = 0, integer = 1, text = 2, id_set = 3 };

value_type_t value_type_of(const field_value_t& value);

std::string_view to_string(value_type_t value);

/// Sort and de-duplicate id sets; other values pass through.
optional_field_value_t normalize(optional_field_value_t value);

id_set_t make_id_set(std::vector<std::string> ids);

/// Equality after normalization; id sets compare as sets.
bool values_equal(const optional_field_value_t& lhs,
                  const optional_field_value_t& rhs);

/// Human readable rendering used by tables and log lines.
std::string to_display(const optional_field_value_t& value);

/// Parse the command-line value syntax: `-` unset, `true`/`false`, integers,
/// `a,b,c` id sets when `type` is id_set, text otherwise.
std::optional<optional_field_value_t> parse_field_value(std::string_view text,
                                                        value_type_t type);

}  // namespace tally::schema
