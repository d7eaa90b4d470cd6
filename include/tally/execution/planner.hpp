#pragma once

#include <tally/execution/change_model.hpp>
#include <tally/execution/remote.hpp>
#include <tally/schema/mutation_request.hpp>
#include <tally/schema/per_id_outcome.hpp>

#include <vector>

namespace tally::execution {

/// Turns a mutation request into minimal per-id writes.
///
/// Ids are processed sequentially in request order and independently: a
/// failure on one id never stops the ones after it. The planner never touches
/// the journal; callers journal the Applied outcomes.
class mutation_planner final {
 public:
  /// `catalog` may be null, in which case reference checks are skipped.
  /// Undo builds its planner in restore mode.
  explicit mutation_planner(
      const remote_capabilities& remote,
      const reference_catalog* catalog = nullptr,
      validation_mode_t mode = validation_mode_t::edit);

  /// Validate, capture, diff and write each id.
  std::vector<tally::schema::per_id_outcome> plan_and_apply(
      const tally::schema::mutation_request& request) const;

  /// Same as plan_and_apply but never writes. An Applied outcome here means
  /// the listed changes would be written.
  std::vector<tally::schema::per_id_outcome> preview(
      const tally::schema::mutation_request& request) const;

 private:
  std::vector<tally::schema::per_id_outcome> run(
      const tally::schema::mutation_request& request,
      bool write) const;

  tally::schema::per_id_outcome plan_one(
      const tally::schema::mutation_request& request,
      const std::string& id,
      bool write) const;

  const remote_capabilities& remote_;
  const reference_catalog* catalog_;
  validation_mode_t mode_;
};

}  // namespace tally::execution
