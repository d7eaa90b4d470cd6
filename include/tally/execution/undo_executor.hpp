#pragma once

#include <tally/execution/remote.hpp>
#include <tally/journal/journal_store.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/error_code.hpp>
#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>
#include <tally/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tally::execution {

/// Entry to undo; no sequence means the most recent eligible entry.
struct undo_target final {
  std::optional<tally::schema::sequence_t> sequence;
};

enum class field_undo_status_t : uint8_t {
  restored = 0,
  conflict = 1,
  not_eligible = 2,
  failed = 3
};

inline constexpr auto kFieldUndoStatusMappings =
    std::array{std::pair<std::string_view, field_undo_status_t>{
                   "restored", field_undo_status_t::restored},
               std::pair<std::string_view, field_undo_status_t>{
                   "conflict", field_undo_status_t::conflict},
               std::pair<std::string_view, field_undo_status_t>{
                   "not eligible", field_undo_status_t::not_eligible},
               std::pair<std::string_view, field_undo_status_t>{
                   "failed", field_undo_status_t::failed}};

inline constexpr std::string_view to_string(const field_undo_status_t value) {
  return tally::schema::to_string(value, kFieldUndoStatusMappings)
      .value_or("unknown");
}

struct field_undo_report final {
  tally::schema::field_t field{};
  field_undo_status_t status{field_undo_status_t::not_eligible};
  // Value the journal recorded as written.
  tally::schema::optional_field_value_t expected;
  // Value found on the service at undo time.
  tally::schema::optional_field_value_t actual;
  // Value the undo restores.
  tally::schema::optional_field_value_t restore_to;
};

struct undo_report final {
  tally::schema::error_code_t code{tally::schema::error_code_t::none};
  std::optional<tally::schema::sequence_t> target;
  std::optional<tally::schema::entity_ref_t> ref;
  std::vector<field_undo_report> fields;
  // Entry recording the restore, when one was appended.
  std::optional<tally::schema::sequence_t> undo_sequence;
  undo_strategy_t strategy{undo_strategy_t::journal_replay};
  std::string detail;
};

/// Reverts journaled changes after re-checking the service for drift.
///
/// A field is restored only while the service still holds the value the
/// journal recorded (or already holds the old value). Anything else is a
/// conflict and is left alone; the original entry keeps those fields Applied.
class undo_executor final {
 public:
  undo_executor(tally::journal::journal_store& journal,
                const remote_capabilities& remote);

  undo_report undo(const undo_target& target);

 private:
  tally::journal::journal_store& journal_;
  const remote_capabilities& remote_;
};

}  // namespace tally::execution
