#pragma once

#include <tally/execution/apply_gate.hpp>
#include <tally/execution/undo_executor.hpp>
#include <tally/schema/entity_record.hpp>
#include <tally/schema/journal_entry.hpp>
#include <tally/schema/per_id_outcome.hpp>

#include <ostream>
#include <vector>

namespace tally::cli {

/// One row per id with status, journal sequence and field changes.
void render_outcomes(std::ostream& out,
                     const std::vector<tally::schema::per_id_outcome>& outcomes,
                     tally::execution::apply_decision_t decision);

/// Per-field restored / conflict / not eligible table.
void render_undo(std::ostream& out,
                 const tally::execution::undo_report& report);

void render_history(std::ostream& out,
                    const std::vector<tally::schema::journal_entry_t>& entries);

void render_record(std::ostream& out,
                   const tally::schema::entity_record_t& record);

}  // namespace tally::cli
