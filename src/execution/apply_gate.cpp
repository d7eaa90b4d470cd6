#include <tally/execution/apply_gate.hpp>

namespace tally::execution {

apply_decision_t decide(const apply_gate_input& input) {
  if (!input.is_write) {
    return apply_decision_t::execute;
  }
  if (input.dry_run) {
    return apply_decision_t::abort_dry_run;
  }
  if (input.confirmed) {
    return apply_decision_t::execute;
  }
  return apply_decision_t::require_confirmation;
}

bool confirmation_possible(const apply_gate_input& input) {
  return !input.non_interactive;
}

}  // namespace tally::execution
