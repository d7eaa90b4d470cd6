#include <tally/execution/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tally::execution {

engine::engine(tally::journal::journal_store& journal,
               const remote_capabilities& remote,
               const reference_catalog* catalog)
    : journal_{journal},
      planner_{remote, catalog},
      undo_executor_{journal, remote} {}

batch_report engine::submit(const tally::schema::mutation_request& request,
                            const apply_gate_input& gate) {
  auto report = batch_report{};
  report.decision = decide(gate);
  switch (report.decision) {
    case apply_decision_t::execute:
      report.outcomes = plan_and_apply(request);
      break;
    case apply_decision_t::abort_dry_run:
      report.outcomes = preview(request);
      break;
    case apply_decision_t::require_confirmation:
      spdlog::debug("{} id(s) awaiting confirmation", request.ids.size());
      break;
  }
  return report;
}

std::vector<tally::schema::per_id_outcome> engine::plan_and_apply(
    const tally::schema::mutation_request& request) {
  auto outcomes = planner_.plan_and_apply(request);
  for (auto& outcome : outcomes) {
    // Failed outcomes only carry changes the service reported as accepted.
    if (outcome.changes.empty() ||
        outcome.status == tally::schema::outcome_status_t::skipped_no_op) {
      continue;
    }
    outcome.sequence = journal_.append(outcome.ref, outcome.changes);
  }
  return outcomes;
}

std::vector<tally::schema::per_id_outcome> engine::preview(
    const tally::schema::mutation_request& request) const {
  return planner_.preview(request);
}

undo_report engine::undo(const undo_target& target) {
  return undo_executor_.undo(target);
}

std::vector<tally::schema::journal_entry_t> engine::history(
    const std::optional<tally::schema::entity_ref_t>& ref,
    const std::size_t limit) const {
  if (!ref.has_value()) {
    return journal_.list(limit);
  }
  auto entries = journal_.entries_for(*ref);
  if (limit != 0 && entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

batch_status_t summarize(
    const std::vector<tally::schema::per_id_outcome>& outcomes) {
  const auto failed = std::ranges::count_if(outcomes, [](const auto& outcome) {
    return outcome.status == tally::schema::outcome_status_t::failed;
  });
  if (failed == 0) {
    return batch_status_t::success;
  }
  if (static_cast<std::size_t>(failed) == outcomes.size()) {
    return batch_status_t::total_failure;
  }
  return batch_status_t::partial_failure;
}

int exit_code(const batch_status_t status) {
  switch (status) {
    case batch_status_t::success:
      return 0;
    case batch_status_t::partial_failure:
      return 2;
    case batch_status_t::total_failure:
      return 3;
  }
  return 3;
}

int exit_code(const undo_report& report) {
  switch (report.code) {
    case tally::schema::error_code_t::none:
      return 0;
    case tally::schema::error_code_t::conflict:
      return 4;
    case tally::schema::error_code_t::no_history:
    case tally::schema::error_code_t::already_undone:
    case tally::schema::error_code_t::superseded:
      return 6;
    default:
      return 5;
  }
}

}  // namespace tally::execution
