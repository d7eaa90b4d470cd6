#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tally::execution {

enum class apply_decision_t : uint8_t {
  execute = 0,
  abort_dry_run = 1,
  require_confirmation = 2
};

inline constexpr auto kApplyDecisionMappings =
    std::array{std::pair<std::string_view, apply_decision_t>{
                   "execute", apply_decision_t::execute},
               std::pair<std::string_view, apply_decision_t>{
                   "dry-run", apply_decision_t::abort_dry_run},
               std::pair<std::string_view, apply_decision_t>{
                   "require-confirmation",
                   apply_decision_t::require_confirmation}};

inline constexpr std::string_view to_string(const apply_decision_t value) {
  return tally::schema::to_string(value, kApplyDecisionMappings)
      .value_or("unknown");
}

struct apply_gate_input final {
  bool is_write{true};
  bool dry_run{false};
  bool non_interactive{false};
  bool confirmed{false};
};

/// Decide whether a request may run. Reads always execute; a dry run never
/// writes; a write needs prior confirmation.
apply_decision_t decide(const apply_gate_input& input);

/// Whether a require_confirmation decision can be resolved by prompting.
/// Non-interactive callers must refuse instead.
bool confirmation_possible(const apply_gate_input& input);

}  // namespace tally::execution
