#pragma once

#include <tally/schema/entity_kind.hpp>
#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>
#include <tally/schema/mutation_request.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally::execution {

/// Type and validation rule of one mutable field.
struct field_spec final {
  tally::schema::field_t field{};
  tally::schema::value_type_t type{tally::schema::value_type_t::text};
  bool nullable{false};
  bool non_empty{false};
  bool non_negative{false};
  // Kind whose ids the value (or every id in an id set) must name.
  std::optional<tally::schema::entity_kind_t> references;
  std::vector<std::string_view> allowed_values;
};

/// Known ids per kind. A kind the catalog does not cover is not checked.
class reference_catalog final {
 public:
  void add(tally::schema::entity_kind_t kind, std::string id);
  /// Mark a kind as covered even when it has no ids.
  void cover(tally::schema::entity_kind_t kind);

  bool covers(tally::schema::entity_kind_t kind) const;
  bool contains(tally::schema::entity_kind_t kind, const std::string& id) const;

 private:
  std::map<tally::schema::entity_kind_t, std::set<std::string>> ids_;
};

/// Edits follow every field rule. Restores put back a value the journal
/// captured from the service, so they may clear a non-nullable field and skip
/// value and reference rules; only the value type is still checked.
enum class validation_mode_t : uint8_t { edit = 0, restore = 1 };

struct validation_result final {
  bool accepted{true};
  std::string reason;
};

/// Closed set of mutable fields for a kind, in display order.
std::span<const field_spec> mutable_fields(tally::schema::entity_kind_t kind);

const field_spec* find_field(tally::schema::entity_kind_t kind,
                             tally::schema::field_t field);

/// Check a candidate value against the kind's rule for field. Pure; never
/// touches the network.
validation_result validate(tally::schema::entity_kind_t kind,
                           tally::schema::field_t field,
                           const tally::schema::optional_field_value_t& candidate,
                           const reference_catalog* catalog = nullptr,
                           validation_mode_t mode = validation_mode_t::edit);

/// Validate an update including its mode. For add/remove the ids are checked
/// as an id set.
validation_result validate(tally::schema::entity_kind_t kind,
                           const tally::schema::field_update& update,
                           const reference_catalog* catalog = nullptr,
                           validation_mode_t mode = validation_mode_t::edit);

/// Desired value of an update given the captured current value.
tally::schema::optional_field_value_t resolve(
    const tally::schema::field_update& update,
    const tally::schema::optional_field_value_t& current);

}  // namespace tally::execution
