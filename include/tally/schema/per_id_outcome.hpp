#pragma once

#include <tally/schema/entity_ref.hpp>
#include <tally/schema/enum_string.hpp>
#include <tally/schema/error_code.hpp>
#include <tally/schema/field_change.hpp>
#include <tally/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: per-id outcome.
// Result of one target id within a batch.
namespace tally::schema {

enum class outcome_status_t : uint8_t {
  applied = 0,
  failed = 1,
  skipped_no_op = 2
};

inline constexpr auto kOutcomeStatusMappings =
    std::array{std::pair<std::string_view, outcome_status_t>{
                   "applied", outcome_status_t::applied},
               std::pair<std::string_view, outcome_status_t>{
                   "failed", outcome_status_t::failed},
               std::pair<std::string_view, outcome_status_t>{
                   "skipped", outcome_status_t::skipped_no_op}};

inline constexpr std::string_view to_string(const outcome_status_t value) {
  return to_string(value, kOutcomeStatusMappings).value_or("unknown");
}

struct per_id_outcome final {
  entity_ref_t ref;
  outcome_status_t status{outcome_status_t::skipped_no_op};
  // Fields written (or, for a failed write the service partially accepted,
  // the fields it reported as accepted).
  std::vector<field_change_t> changes;
  // Fields already at the desired value.
  std::vector<field_t> unchanged;
  error_code_t code{error_code_t::none};
  std::string detail;
  std::optional<sequence_t> sequence;
};

}  // namespace tally::schema
