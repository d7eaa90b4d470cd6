#pragma once

#include <tally/schema/entity_kind.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/enum_string.hpp>
#include <tally/schema/error_code.hpp>
#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tally::execution {

/// Values of the requested fields, or a not_found / read_failed code.
struct read_result final {
  tally::schema::error_code_t code{tally::schema::error_code_t::none};
  tally::schema::field_value_map_t values;
  std::string detail;
};

/// Outcome of one remote write. When a write fails but the service reports
/// which fields it still accepted, `accepted_fields` lists them.
struct write_result final {
  tally::schema::error_code_t code{tally::schema::error_code_t::none};
  std::string detail;
  std::optional<std::vector<tally::schema::field_t>> accepted_fields;
};

using read_fields_t = std::function<read_result(
    const tally::schema::entity_ref_t& ref,
    const std::vector<tally::schema::field_t>& fields)>;

using write_fields_t =
    std::function<write_result(const tally::schema::entity_ref_t& ref,
                               const tally::schema::field_value_map_t& values)>;

/// Service-side undo of the given restore set. The service reports success
/// through the same shape as a write.
using native_undo_t =
    std::function<write_result(const tally::schema::entity_ref_t& ref,
                               const tally::schema::field_value_map_t& values)>;

/// Field-level access to the remote service. Transport and session handling
/// live behind these callables.
struct remote_capabilities final {
  read_fields_t read_fields;
  write_fields_t write_fields;
  native_undo_t native_undo;
  // Kinds whose undo goes through native_undo instead of journal replay.
  std::set<tally::schema::entity_kind_t> native_undo_kinds;
};

enum class undo_strategy_t : uint8_t { journal_replay = 0, native_undo = 1 };

inline constexpr auto kUndoStrategyMappings =
    std::array{std::pair<std::string_view, undo_strategy_t>{
                   "journal-replay", undo_strategy_t::journal_replay},
               std::pair<std::string_view, undo_strategy_t>{
                   "native-undo", undo_strategy_t::native_undo}};

inline constexpr std::string_view to_string(const undo_strategy_t value) {
  return tally::schema::to_string(value, kUndoStrategyMappings)
      .value_or("unknown");
}

/// Strategy for a kind: native undo only when the service offers it for that
/// kind.
inline undo_strategy_t select_undo_strategy(
    const remote_capabilities& remote,
    const tally::schema::entity_kind_t kind) {
  if (remote.native_undo && remote.native_undo_kinds.contains(kind)) {
    return undo_strategy_t::native_undo;
  }
  return undo_strategy_t::journal_replay;
}

}  // namespace tally::execution
