#include <tally/execution/capture.hpp>
#include <tally/execution/planner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace tally::execution {

namespace {

/// Request-level validation; the result applies to every id alike.
validation_result validate_request(
    const tally::schema::mutation_request& request,
    const reference_catalog* catalog,
    const validation_mode_t mode) {
  if (request.updates.empty()) {
    return validation_result{.accepted = false,
                             .reason = "no fields to update"};
  }
  auto seen = std::set<tally::schema::field_t>{};
  for (const auto& update : request.updates) {
    if (!seen.insert(update.field).second) {
      return validation_result{
          .accepted = false,
          .reason = "field '" +
                    std::string{tally::schema::to_string(update.field)} +
                    "' given more than once"};
    }
    auto result = validate(request.kind, update, catalog, mode);
    if (!result.accepted) {
      return result;
    }
  }
  return {};
}

tally::schema::per_id_outcome failed(tally::schema::entity_ref_t ref,
                                     const tally::schema::error_code_t code,
                                     std::string detail) {
  auto outcome = tally::schema::per_id_outcome{};
  outcome.ref = std::move(ref);
  outcome.status = tally::schema::outcome_status_t::failed;
  outcome.code = code;
  outcome.detail = std::move(detail);
  return outcome;
}

}  // namespace

mutation_planner::mutation_planner(const remote_capabilities& remote,
                                   const reference_catalog* catalog,
                                   const validation_mode_t mode)
    : remote_{remote}, catalog_{catalog}, mode_{mode} {}

std::vector<tally::schema::per_id_outcome> mutation_planner::plan_and_apply(
    const tally::schema::mutation_request& request) const {
  return run(request, true);
}

std::vector<tally::schema::per_id_outcome> mutation_planner::preview(
    const tally::schema::mutation_request& request) const {
  return run(request, false);
}

std::vector<tally::schema::per_id_outcome> mutation_planner::run(
    const tally::schema::mutation_request& request,
    const bool write) const {
  auto outcomes = std::vector<tally::schema::per_id_outcome>{};
  outcomes.reserve(request.ids.size());

  const auto validation = validate_request(request, catalog_, mode_);
  for (const auto& id : request.ids) {
    auto ref = tally::schema::make_entity_ref(request.kind, id);
    if (!validation.accepted) {
      spdlog::warn("{} rejected: {}", tally::schema::to_display(ref),
                   validation.reason);
      outcomes.push_back(failed(std::move(ref),
                                tally::schema::error_code_t::validation_rejected,
                                validation.reason));
      continue;
    }
    if (id.empty()) {
      outcomes.push_back(failed(std::move(ref),
                                tally::schema::error_code_t::validation_rejected,
                                "empty id"));
      continue;
    }
    outcomes.push_back(plan_one(request, id, write));
  }
  return outcomes;
}

tally::schema::per_id_outcome mutation_planner::plan_one(
    const tally::schema::mutation_request& request,
    const std::string& id,
    const bool write) const {
  auto ref = tally::schema::make_entity_ref(request.kind, id);

  auto fields = std::vector<tally::schema::field_t>{};
  fields.reserve(request.updates.size());
  for (const auto& update : request.updates) {
    fields.push_back(update.field);
  }

  auto current = capture(remote_.read_fields, ref, fields);
  if (current.code != tally::schema::error_code_t::none) {
    spdlog::warn("{} capture failed: {}", tally::schema::to_display(ref),
                 current.detail);
    return failed(std::move(ref), current.code, std::move(current.detail));
  }

  auto outcome = tally::schema::per_id_outcome{};
  outcome.ref = ref;
  auto write_set = tally::schema::field_value_map_t{};
  for (const auto& update : request.updates) {
    const auto& old_value = current.values[update.field];
    auto new_value = resolve(update, old_value);
    if (tally::schema::values_equal(old_value, new_value)) {
      outcome.unchanged.push_back(update.field);
      continue;
    }
    write_set[update.field] = new_value;
    outcome.changes.push_back(tally::schema::field_change_t{
        .version = 1,
        .field = update.field,
        .old_value = old_value,
        .new_value = std::move(new_value)});
  }

  if (outcome.changes.empty()) {
    spdlog::debug("{} already up to date", tally::schema::to_display(ref));
    outcome.status = tally::schema::outcome_status_t::skipped_no_op;
    return outcome;
  }
  if (!write) {
    outcome.status = tally::schema::outcome_status_t::applied;
    return outcome;
  }
  if (!remote_.write_fields) {
    return failed(std::move(ref), tally::schema::error_code_t::write_failed,
                  "no write capability configured");
  }

  auto written = remote_.write_fields(ref, write_set);
  if (written.code == tally::schema::error_code_t::none) {
    spdlog::info("{} updated {} field(s)", tally::schema::to_display(ref),
                 outcome.changes.size());
    outcome.status = tally::schema::outcome_status_t::applied;
    return outcome;
  }

  spdlog::warn("{} write failed: {}", tally::schema::to_display(ref),
               written.detail);
  auto changes = std::move(outcome.changes);
  outcome = failed(std::move(ref), written.code, std::move(written.detail));
  if (outcome.detail.empty()) {
    outcome.detail = std::string{tally::schema::to_string(written.code)};
  }
  if (written.accepted_fields.has_value()) {
    // The service reported which fields landed; keep those so they can be
    // journaled and undone.
    for (auto& change : changes) {
      if (std::ranges::find(*written.accepted_fields, change.field) !=
          std::end(*written.accepted_fields)) {
        outcome.changes.push_back(std::move(change));
      }
    }
  }
  return outcome;
}

}  // namespace tally::execution
