#pragma once

#include <tally/schema/entity_ref.hpp>
#include <tally/schema/entry_state.hpp>
#include <tally/schema/field_change.hpp>
#include <tally/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Schema type: journal entry.
// Unit of undoable history. `changes` is immutable once appended;
// `field_states` runs parallel to it and is the only part that transitions.
namespace tally::schema {

template <uint16_t Version>
struct journal_entry;

template <>
struct journal_entry<1> final {
  uint16_t version{1};
  sequence_t sequence{};
  timestamp_milliseconds_t recorded_at{};
  entity_ref_t ref;
  std::vector<field_change_t> changes;
  std::vector<entry_state_t> field_states;
  entry_origin_t origin{entry_origin_t::mutation};
  std::optional<sequence_t> reverts;
};

using journal_entry_t = journal_entry<1>;

/// Applied if any field is Applied, else Undone if any field is Undone, else
/// Superseded.
entry_state_t overall_state(const journal_entry_t& entry);

std::optional<std::size_t> find_change(const journal_entry_t& entry,
                                       field_t field);

std::vector<field_t> fields_in_state(const journal_entry_t& entry,
                                     entry_state_t state);

bool is_eligible(const journal_entry_t& entry);

}  // namespace tally::schema
