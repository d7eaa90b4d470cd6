#include <tally/execution/capture.hpp>
#include <tally/execution/planner.hpp>
#include <tally/execution/undo_executor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace tally::execution {

namespace {

using tally::schema::entry_state_t;
using tally::schema::error_code_t;
using tally::schema::journal_entry_t;

/// Fields of the target split by what the undo will do with them.
struct undo_plan final {
  journal_entry_t entry;
  // Still hold the recorded new value and need a write.
  std::vector<tally::schema::field_t> to_restore;
  // Already back at the recorded old value.
  std::vector<tally::schema::field_t> already_restored;
};

std::string describe_target(const undo_target& target) {
  if (target.sequence.has_value()) {
    return "journal entry " + std::to_string(*target.sequence);
  }
  return "last eligible entry";
}

field_undo_report& report_for(undo_report& report,
                              const tally::schema::field_t field) {
  auto it = std::ranges::find(report.fields, field, &field_undo_report::field);
  return *it;
}

void mark_fields(undo_report& report,
                 const std::vector<tally::schema::field_t>& fields,
                 const field_undo_status_t status) {
  for (const auto field : fields) {
    report_for(report, field).status = status;
  }
}

std::vector<tally::schema::field_t> concat(
    std::vector<tally::schema::field_t> lhs,
    const std::vector<tally::schema::field_t>& rhs) {
  lhs.insert(std::end(lhs), std::begin(rhs), std::end(rhs));
  return lhs;
}

bool has_conflict(const undo_report& report) {
  return std::ranges::any_of(report.fields, [](const auto& field) {
    return field.status == field_undo_status_t::conflict;
  });
}

/// Resolve the target and re-check drift while holding the write lock, so
/// eligibility is judged on fresh journal state.
std::optional<undo_plan> prepare(tally::journal::journal_store& journal,
                                 const remote_capabilities& remote,
                                 const undo_target& target,
                                 undo_report& report) {
  auto session = journal.begin_write();
  auto entry = target.sequence.has_value() ? session.find(*target.sequence)
                                           : session.last_eligible_entry();
  if (!entry.has_value()) {
    report.code = error_code_t::no_history;
    report.detail = "nothing to undo: no " + describe_target(target);
    return std::nullopt;
  }

  report.target = entry->sequence;
  report.ref = entry->ref;
  for (std::size_t i = 0; i < entry->changes.size(); ++i) {
    const auto& change = entry->changes[i];
    report.fields.push_back(field_undo_report{.field = change.field,
                                              .status =
                                                  field_undo_status_t::not_eligible,
                                              .expected = change.new_value,
                                              .actual = {},
                                              .restore_to = change.old_value});
  }

  const auto eligible = tally::schema::fields_in_state(*entry, entry_state_t::applied);
  if (eligible.empty()) {
    if (tally::schema::overall_state(*entry) == entry_state_t::undone) {
      report.code = error_code_t::already_undone;
      report.detail = "journal entry " + std::to_string(entry->sequence) +
                      " was already undone";
    } else {
      report.code = error_code_t::superseded;
      report.detail = "journal entry " + std::to_string(entry->sequence) +
                      " was superseded by a later change";
    }
    return std::nullopt;
  }

  auto current = capture(remote.read_fields, entry->ref, eligible);
  if (current.code != error_code_t::none) {
    report.code = current.code;
    report.detail = current.detail;
    mark_fields(report, eligible, field_undo_status_t::failed);
    return std::nullopt;
  }

  auto plan = undo_plan{};
  for (const auto field : eligible) {
    const auto& change = entry->changes[*tally::schema::find_change(*entry, field)];
    auto& field_report = report_for(report, field);
    field_report.actual = current.values[field];
    if (tally::schema::values_equal(field_report.actual, change.new_value)) {
      plan.to_restore.push_back(field);
    } else if (tally::schema::values_equal(field_report.actual,
                                           change.old_value)) {
      field_report.status = field_undo_status_t::restored;
      plan.already_restored.push_back(field);
    } else {
      field_report.status = field_undo_status_t::conflict;
      spdlog::warn("undo {} {}: expected {}, found {}",
                   tally::schema::to_display(entry->ref),
                   tally::schema::to_string(field),
                   tally::schema::to_display(change.new_value),
                   tally::schema::to_display(field_report.actual));
    }
  }
  plan.entry = std::move(*entry);
  return plan;
}

tally::schema::field_value_map_t restore_values(const undo_plan& plan) {
  auto values = tally::schema::field_value_map_t{};
  for (const auto field : plan.to_restore) {
    const auto& change =
        plan.entry.changes[*tally::schema::find_change(plan.entry, field)];
    values[field] = change.old_value;
  }
  return values;
}

}  // namespace

undo_executor::undo_executor(tally::journal::journal_store& journal,
                             const remote_capabilities& remote)
    : journal_{journal}, remote_{remote} {}

undo_report undo_executor::undo(const undo_target& target) {
  auto report = undo_report{};
  auto plan = prepare(journal_, remote_, target, report);
  if (!plan.has_value()) {
    if (report.code != error_code_t::none) {
      spdlog::warn("undo of {} not performed: {}", describe_target(target),
                   report.detail);
    }
    return report;
  }

  const auto& ref = plan->entry.ref;
  const auto sequence = plan->entry.sequence;
  report.strategy = select_undo_strategy(remote_, ref.kind);

  if (plan->to_restore.empty()) {
    if (!plan->already_restored.empty()) {
      journal_.mark(sequence, plan->already_restored, entry_state_t::undone);
    }
    if (has_conflict(report)) {
      report.code = error_code_t::conflict;
      report.detail = "every eligible field was changed on the service";
    }
    return report;
  }

  auto restored_changes = std::vector<tally::schema::field_change_t>{};
  auto failure = std::optional<std::pair<error_code_t, std::string>>{};

  if (report.strategy == undo_strategy_t::native_undo) {
    auto values = restore_values(*plan);
    auto result = remote_.native_undo(ref, values);
    if (result.code == error_code_t::none) {
      for (const auto field : plan->to_restore) {
        const auto& change =
            plan->entry.changes[*tally::schema::find_change(plan->entry, field)];
        restored_changes.push_back(
            tally::schema::field_change_t{.version = 1,
                                          .field = field,
                                          .old_value = change.new_value,
                                          .new_value = change.old_value});
      }
    } else {
      failure.emplace(result.code, std::move(result.detail));
    }
  } else {
    auto request = tally::schema::mutation_request{};
    request.kind = ref.kind;
    request.ids.push_back(ref.id);
    for (auto& [field, value] : restore_values(*plan)) {
      request.updates.push_back(tally::schema::set_field(field, std::move(value)));
    }
    // The old value came from the service, so it goes back even where an
    // edit would be refused (a category that was never set, say).
    auto planner =
        mutation_planner{remote_, nullptr, validation_mode_t::restore};
    auto outcomes = planner.plan_and_apply(request);
    auto& outcome = outcomes.front();
    restored_changes = std::move(outcome.changes);
    if (outcome.status == tally::schema::outcome_status_t::failed) {
      failure.emplace(outcome.code, std::move(outcome.detail));
    }
  }

  auto restored_fields = std::vector<tally::schema::field_t>{};
  if (failure.has_value()) {
    // Only fields the service reported as accepted, plus those already back
    // at their old value, count as restored.
    for (const auto& change : restored_changes) {
      restored_fields.push_back(change.field);
    }
    mark_fields(report, plan->to_restore, field_undo_status_t::failed);
    mark_fields(report, restored_fields, field_undo_status_t::restored);
    restored_fields =
        concat(std::move(restored_fields), plan->already_restored);
    report.code = failure->first;
    report.detail = std::move(failure->second);
  } else {
    restored_fields = concat(plan->to_restore, plan->already_restored);
    mark_fields(report, plan->to_restore, field_undo_status_t::restored);
  }

  if (!restored_changes.empty()) {
    auto options = tally::journal::append_options{};
    options.reverts = sequence;
    options.reverted_fields = restored_fields;
    if (report.strategy == undo_strategy_t::native_undo) {
      options.origin = tally::schema::entry_origin_t::native_undo;
      options.initial_state = entry_state_t::undone;
    } else {
      options.origin = tally::schema::entry_origin_t::journal_undo;
    }
    report.undo_sequence =
        journal_.append(ref, std::move(restored_changes), options);
  } else if (!restored_fields.empty()) {
    journal_.mark(sequence, restored_fields, entry_state_t::undone);
  }

  if (!failure.has_value() && has_conflict(report)) {
    report.code = error_code_t::conflict;
    report.detail = "some fields were changed on the service and were kept";
  }
  if (report.code == error_code_t::none) {
    spdlog::info("undid journal entry {} for {}", sequence,
                 tally::schema::to_display(ref));
  } else {
    spdlog::warn("undo of journal entry {} ended with {}: {}", sequence,
                 tally::schema::to_string(report.code), report.detail);
  }
  return report;
}

}  // namespace tally::execution
