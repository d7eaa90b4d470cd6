#include <gtest/gtest.h>
#include <tally/execution/undo_executor.hpp>
#include <tally/testing/engine_fixture.hpp>

#include <stdexcept>

namespace {

using tally::execution::field_undo_status_t;
using tally::execution::undo_target;
using tally::schema::entity_kind_t;
using tally::schema::entry_state_t;
using tally::schema::error_code_t;
using tally::schema::field_t;
using tally::testing::make_request;
using tally::testing::transaction;

tally::schema::mutation_request set_notes(std::vector<std::string> ids,
                                          std::string notes) {
  return make_request(
      entity_kind_t::transaction, std::move(ids),
      {tally::schema::set_field(field_t::notes,
                                tally::testing::text(std::move(notes)))});
}

const tally::execution::field_undo_report& field_report(
    const tally::execution::undo_report& report,
    const field_t field) {
  for (const auto& entry : report.fields) {
    if (entry.field == field) {
      return entry;
    }
  }
  throw std::runtime_error{"field not in report"};
}

}  // namespace

TEST(undo_executor, restores_old_values_and_marks_entry_undone) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_restore"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("before")},
                        {field_t::reviewed, tally::testing::boolean(false)}});
  auto outcomes = fixture.engine().plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::notes, tally::testing::text("after")),
       tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))}));
  ASSERT_TRUE(outcomes[0].sequence.has_value());

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::none);
  EXPECT_EQ(report.target, outcomes[0].sequence);
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("before"));
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::reviewed),
            tally::testing::boolean(false));
  EXPECT_EQ(field_report(report, field_t::notes).status,
            field_undo_status_t::restored);

  auto original = fixture.journal().find(*outcomes[0].sequence);
  EXPECT_EQ(tally::schema::overall_state(*original), entry_state_t::undone);

  ASSERT_TRUE(report.undo_sequence.has_value());
  auto recorded = fixture.journal().find(*report.undo_sequence);
  EXPECT_EQ(recorded->origin, tally::schema::entry_origin_t::journal_undo);
  EXPECT_EQ(recorded->reverts, outcomes[0].sequence);
  EXPECT_EQ(recorded->changes.size(), 2u);
}

TEST(undo_executor, undo_of_an_undo_reapplies_the_change) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_redo"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("before")}});
  fixture.engine().plan_and_apply(set_notes({"t1"}, "after"));

  auto first = fixture.engine().undo(undo_target{});
  ASSERT_EQ(first.code, error_code_t::none);
  auto second = fixture.engine().undo(undo_target{});
  EXPECT_EQ(second.code, error_code_t::none);
  EXPECT_EQ(second.target, first.undo_sequence);
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("after"));
}

TEST(undo_executor, empty_journal_reports_no_history) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_empty"};
  auto report = fixture.engine().undo(undo_target{});
  EXPECT_EQ(report.code, error_code_t::no_history);
  EXPECT_EQ(tally::execution::exit_code(report), 6);

  auto specific = fixture.engine().undo(undo_target{.sequence = 42});
  EXPECT_EQ(specific.code, error_code_t::no_history);
}

TEST(undo_executor, second_undo_of_same_entry_is_already_undone) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_twice"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("before")}});
  auto outcomes = fixture.engine().plan_and_apply(set_notes({"t1"}, "after"));
  auto sequence = *outcomes[0].sequence;

  ASSERT_EQ(fixture.engine().undo(undo_target{.sequence = sequence}).code,
            error_code_t::none);
  auto again = fixture.engine().undo(undo_target{.sequence = sequence});
  EXPECT_EQ(again.code, error_code_t::already_undone);
  EXPECT_EQ(field_report(again, field_t::notes).status,
            field_undo_status_t::not_eligible);
}

TEST(undo_executor, superseded_entry_is_not_eligible) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_superseded"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("v0")}});
  auto first = fixture.engine().plan_and_apply(set_notes({"t1"}, "v1"));
  fixture.engine().plan_and_apply(set_notes({"t1"}, "v2"));

  auto report =
      fixture.engine().undo(undo_target{.sequence = *first[0].sequence});
  EXPECT_EQ(report.code, error_code_t::superseded);
  EXPECT_EQ(tally::execution::exit_code(report), 6);
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("v2"));

  // The latest entry still undoes to v1.
  auto latest = fixture.engine().undo(undo_target{});
  EXPECT_EQ(latest.code, error_code_t::none);
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("v1"));
}

TEST(undo_executor, drift_to_a_third_value_is_a_conflict) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_conflict"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("A")},
                        {field_t::reviewed, tally::testing::boolean(false)}});
  auto outcomes = fixture.engine().plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::notes, tally::testing::text("B")),
       tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))}));
  fixture.remote().set(transaction("t1"), field_t::notes,
                       tally::testing::text("C"));

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::conflict);
  EXPECT_EQ(tally::execution::exit_code(report), 4);
  const auto& notes = field_report(report, field_t::notes);
  EXPECT_EQ(notes.status, field_undo_status_t::conflict);
  EXPECT_EQ(notes.expected, tally::testing::text("B"));
  EXPECT_EQ(notes.actual, tally::testing::text("C"));
  EXPECT_EQ(field_report(report, field_t::reviewed).status,
            field_undo_status_t::restored);

  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("C"));
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::reviewed),
            tally::testing::boolean(false));

  auto original = fixture.journal().find(*outcomes[0].sequence);
  auto notes_index = *tally::schema::find_change(*original, field_t::notes);
  auto reviewed_index = *tally::schema::find_change(*original, field_t::reviewed);
  EXPECT_EQ(original->field_states[notes_index], entry_state_t::applied);
  EXPECT_EQ(original->field_states[reviewed_index], entry_state_t::undone);
}

TEST(undo_executor, external_flip_back_to_old_value_is_not_a_conflict) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_flip_back"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("A")}});
  auto outcomes = fixture.engine().plan_and_apply(set_notes({"t1"}, "B"));
  fixture.remote().set(transaction("t1"), field_t::notes,
                       tally::testing::text("A"));
  const auto writes = fixture.remote().writes();

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::none);
  EXPECT_EQ(field_report(report, field_t::notes).status,
            field_undo_status_t::restored);
  EXPECT_EQ(fixture.remote().writes(), writes);
  EXPECT_FALSE(report.undo_sequence.has_value());
  EXPECT_EQ(tally::schema::overall_state(
                *fixture.journal().find(*outcomes[0].sequence)),
            entry_state_t::undone);
}

TEST(undo_executor, failed_restore_leaves_entry_applied_for_retry) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_write_failed"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("A")}});
  auto outcomes = fixture.engine().plan_and_apply(set_notes({"t1"}, "B"));
  fixture.remote().fail_writes(transaction("t1"));

  auto failed = fixture.engine().undo(undo_target{});
  EXPECT_EQ(failed.code, error_code_t::write_failed);
  EXPECT_EQ(tally::execution::exit_code(failed), 5);
  EXPECT_EQ(field_report(failed, field_t::notes).status,
            field_undo_status_t::failed);
  EXPECT_EQ(tally::schema::overall_state(
                *fixture.journal().find(*outcomes[0].sequence)),
            entry_state_t::applied);

  fixture.remote().heal();
  auto retried = fixture.engine().undo(undo_target{});
  EXPECT_EQ(retried.code, error_code_t::none);
  EXPECT_EQ(fixture.remote().get(transaction("t1"), field_t::notes),
            tally::testing::text("A"));
}

TEST(undo_executor, restores_a_field_that_was_never_set) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_unset_old"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::reviewed, tally::testing::boolean(false)}});
  auto outcomes = fixture.engine().plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::category_id,
                                tally::testing::text("c1"))}));
  ASSERT_EQ(outcomes[0].status, tally::schema::outcome_status_t::applied);
  ASSERT_FALSE(outcomes[0].changes[0].old_value.has_value());

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::none) << report.detail;
  EXPECT_EQ(field_report(report, field_t::category_id).status,
            field_undo_status_t::restored);
  EXPECT_FALSE(fixture.remote()
                   .get(transaction("t1"), field_t::category_id)
                   .has_value());
  EXPECT_EQ(tally::schema::overall_state(
                *fixture.journal().find(*outcomes[0].sequence)),
            entry_state_t::undone);
  EXPECT_EQ(fixture.engine().undo(undo_target{}).target, report.undo_sequence);
}

TEST(undo_executor, failed_restore_still_records_fields_already_back) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_failed_mixed"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("A")},
                        {field_t::reviewed, tally::testing::boolean(false)}});
  auto outcomes = fixture.engine().plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::notes, tally::testing::text("B")),
       tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))}));
  fixture.remote().set(transaction("t1"), field_t::reviewed,
                       tally::testing::boolean(false));
  fixture.remote().fail_writes(transaction("t1"));

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::write_failed);
  EXPECT_EQ(field_report(report, field_t::notes).status,
            field_undo_status_t::failed);
  EXPECT_EQ(field_report(report, field_t::reviewed).status,
            field_undo_status_t::restored);
  auto entry = fixture.journal().find(*outcomes[0].sequence);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(tally::schema::fields_in_state(*entry, entry_state_t::applied),
            (std::vector<field_t>{field_t::notes}));
  EXPECT_EQ(tally::schema::fields_in_state(*entry, entry_state_t::undone),
            (std::vector<field_t>{field_t::reviewed}));
}

TEST(undo_executor, read_failure_during_recapture_is_reported) {
  auto fixture = tally::testing::engine_fixture{"tally_undo_read_failed"};
  fixture.remote().put(transaction("t1"),
                       {{field_t::notes, tally::testing::text("A")}});
  fixture.engine().plan_and_apply(set_notes({"t1"}, "B"));
  fixture.remote().fail_reads(transaction("t1"));

  auto report = fixture.engine().undo(undo_target{});
  EXPECT_EQ(report.code, error_code_t::read_failed);
  EXPECT_EQ(tally::execution::exit_code(report), 5);
}

TEST(undo_executor, native_strategy_records_an_undone_entry) {
  auto fixture = tally::testing::engine_fixture{
      "tally_undo_native", {entity_kind_t::category}};
  fixture.remote().put(tally::testing::category("c1"),
                       {{field_t::name, tally::testing::text("Food")}});
  auto outcomes = fixture.engine().plan_and_apply(make_request(
      entity_kind_t::category, {"c1"},
      {tally::schema::set_field(field_t::name, tally::testing::text("Dining"))}));
  const auto writes = fixture.remote().writes();

  auto report = fixture.engine().undo(undo_target{});

  EXPECT_EQ(report.code, error_code_t::none);
  EXPECT_EQ(report.strategy, tally::execution::undo_strategy_t::native_undo);
  EXPECT_EQ(fixture.remote().native_undos(), 1u);
  EXPECT_EQ(fixture.remote().writes(), writes);
  EXPECT_EQ(fixture.remote().get(tally::testing::category("c1"), field_t::name),
            tally::testing::text("Food"));

  ASSERT_TRUE(report.undo_sequence.has_value());
  auto recorded = fixture.journal().find(*report.undo_sequence);
  EXPECT_EQ(recorded->origin, tally::schema::entry_origin_t::native_undo);
  EXPECT_EQ(tally::schema::overall_state(*recorded), entry_state_t::undone);
  EXPECT_EQ(tally::schema::overall_state(
                *fixture.journal().find(*outcomes[0].sequence)),
            entry_state_t::undone);
  EXPECT_EQ(fixture.engine().undo(undo_target{}).code, error_code_t::no_history);
}
