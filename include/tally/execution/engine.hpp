#pragma once

#include <tally/execution/apply_gate.hpp>
#include <tally/execution/change_model.hpp>
#include <tally/execution/planner.hpp>
#include <tally/execution/remote.hpp>
#include <tally/execution/undo_executor.hpp>
#include <tally/journal/journal_store.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/journal_entry.hpp>
#include <tally/schema/mutation_request.hpp>
#include <tally/schema/per_id_outcome.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace tally::execution {

enum class batch_status_t : uint8_t {
  success = 0,
  partial_failure = 1,
  total_failure = 2
};

/// Gate decision plus per-id outcomes. On abort_dry_run the outcomes are the
/// preview; on require_confirmation nothing ran and outcomes is empty.
struct batch_report final {
  apply_decision_t decision{apply_decision_t::execute};
  std::vector<tally::schema::per_id_outcome> outcomes;
};

/// Mutation safety engine: gate, plan, write, journal and undo.
///
/// Holds references only. The journal and the remote capabilities must
/// outlive the engine.
class engine final {
 public:
  /// `catalog` may be null to skip reference checks.
  engine(tally::journal::journal_store& journal,
         const remote_capabilities& remote,
         const reference_catalog* catalog = nullptr);

  /// Evaluate the apply gate once, then execute, preview or stop.
  batch_report submit(const tally::schema::mutation_request& request,
                      const apply_gate_input& gate);

  /// Apply a request and journal every outcome that carries changes. The
  /// journal sequence is filled in on those outcomes.
  std::vector<tally::schema::per_id_outcome> plan_and_apply(
      const tally::schema::mutation_request& request);

  /// Planned diff without writes or journaling.
  std::vector<tally::schema::per_id_outcome> preview(
      const tally::schema::mutation_request& request) const;

  undo_report undo(const undo_target& target);

  /// Journal entries, most recent first, for one entity or for everything.
  std::vector<tally::schema::journal_entry_t> history(
      const std::optional<tally::schema::entity_ref_t>& ref,
      std::size_t limit = 0) const;

 private:
  tally::journal::journal_store& journal_;
  mutation_planner planner_;
  undo_executor undo_executor_;
};

batch_status_t summarize(
    const std::vector<tally::schema::per_id_outcome>& outcomes);

/// Process exit code for a batch: 0 success, 2 partial, 3 total failure.
int exit_code(batch_status_t status);

/// Process exit code for an undo: 0 restored, 4 conflict, 5 transport or
/// read failure, 6 nothing eligible.
int exit_code(const undo_report& report);

}  // namespace tally::execution
