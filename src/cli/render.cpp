#include <tally/cli/render.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <ctime>
#include <string>

namespace tally::cli {

namespace {

std::string describe_change(const tally::schema::field_change_t& change) {
  return fmt::format("{}: {} -> {}", tally::schema::to_string(change.field),
                     tally::schema::to_display(change.old_value),
                     tally::schema::to_display(change.new_value));
}

std::string format_time(const tally::schema::timestamp_milliseconds_t ms) {
  const auto seconds = static_cast<std::time_t>(ms / 1000);
  auto tm = std::tm{};
  gmtime_r(&seconds, &tm);
  auto buffer = std::array<char, 32>{};
  std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string{buffer.data()};
}

}  // namespace

void render_outcomes(std::ostream& out,
                     const std::vector<tally::schema::per_id_outcome>& outcomes,
                     const tally::execution::apply_decision_t decision) {
  const auto dry_run =
      decision == tally::execution::apply_decision_t::abort_dry_run;
  if (dry_run) {
    out << "dry-run: nothing was written\n";
  }
  out << fmt::format("{:<28} {:<10} {:>6}  {}\n", "ID", "STATUS", "SEQ",
                     "DETAIL");
  for (const auto& outcome : outcomes) {
    auto status = std::string{tally::schema::to_string(outcome.status)};
    if (dry_run && outcome.status == tally::schema::outcome_status_t::applied) {
      status = "planned";
    }
    const auto sequence = outcome.sequence.has_value()
                              ? std::to_string(*outcome.sequence)
                              : std::string{"-"};
    auto details = std::vector<std::string>{};
    if (outcome.status == tally::schema::outcome_status_t::failed) {
      details.push_back(fmt::format("{}: {}",
                                    tally::schema::to_string(outcome.code),
                                    outcome.detail));
    }
    for (const auto& change : outcome.changes) {
      details.push_back(describe_change(change));
    }
    for (const auto field : outcome.unchanged) {
      details.push_back(
          fmt::format("{}: unchanged", tally::schema::to_string(field)));
    }
    if (details.empty()) {
      details.emplace_back();
    }
    out << fmt::format("{:<28} {:<10} {:>6}  {}\n",
                       tally::schema::to_display(outcome.ref), status, sequence,
                       details.front());
    for (std::size_t i = 1; i < details.size(); ++i) {
      out << fmt::format("{:<28} {:<10} {:>6}  {}\n", "", "", "", details[i]);
    }
  }
}

void render_undo(std::ostream& out,
                 const tally::execution::undo_report& report) {
  if (report.target.has_value()) {
    out << fmt::format("undo of journal entry {} ({}, {})\n", *report.target,
                       report.ref.has_value()
                           ? tally::schema::to_display(*report.ref)
                           : std::string{"-"},
                       tally::execution::to_string(report.strategy));
  }
  if (!report.fields.empty()) {
    out << fmt::format("{:<16} {:<13} {:<20} {:<20} {}\n", "FIELD", "RESULT",
                       "EXPECTED", "ACTUAL", "RESTORE TO");
    for (const auto& field : report.fields) {
      out << fmt::format(
          "{:<16} {:<13} {:<20} {:<20} {}\n",
          tally::schema::to_string(field.field),
          tally::execution::to_string(field.status),
          tally::schema::to_display(field.expected),
          field.status == tally::execution::field_undo_status_t::not_eligible
              ? std::string{"-"}
              : tally::schema::to_display(field.actual),
          tally::schema::to_display(field.restore_to));
    }
  }
  if (report.undo_sequence.has_value()) {
    out << fmt::format("recorded as journal entry {}\n", *report.undo_sequence);
  }
  if (report.code != tally::schema::error_code_t::none) {
    out << fmt::format("{}: {}\n", tally::schema::to_string(report.code),
                       report.detail);
  }
}

void render_history(std::ostream& out,
                    const std::vector<tally::schema::journal_entry_t>& entries) {
  if (entries.empty()) {
    out << "no journal entries\n";
    return;
  }
  out << fmt::format("{:>6}  {:<20} {:<12} {:<28} {:<11} {}\n", "SEQ", "TIME",
                     "ORIGIN", "ENTITY", "STATE", "CHANGES");
  for (const auto& entry : entries) {
    auto origin = std::string{tally::schema::to_string(entry.origin)};
    if (entry.reverts.has_value()) {
      origin += fmt::format(" #{}", *entry.reverts);
    }
    for (std::size_t i = 0; i < entry.changes.size(); ++i) {
      const auto state = i < entry.field_states.size()
                             ? tally::schema::to_string(entry.field_states[i])
                             : std::string_view{"unknown"};
      if (i == 0) {
        out << fmt::format("{:>6}  {:<20} {:<12} {:<28} {:<11} {}\n",
                           entry.sequence, format_time(entry.recorded_at),
                           origin, tally::schema::to_display(entry.ref), state,
                           describe_change(entry.changes[i]));
      } else {
        out << fmt::format("{:>6}  {:<20} {:<12} {:<28} {:<11} {}\n", "", "",
                           "", "", state, describe_change(entry.changes[i]));
      }
    }
  }
}

void render_record(std::ostream& out,
                   const tally::schema::entity_record_t& record) {
  out << tally::schema::to_display(record.ref) << '\n';
  for (const auto& [field, value] : record.fields) {
    out << fmt::format("  {:<16} {}\n", tally::schema::to_string(field),
                       tally::schema::to_display(value));
  }
}

}  // namespace tally::cli
