#include <gtest/gtest.h>
#include <tally/execution/planner.hpp>
#include <tally/testing/engine_fixture.hpp>
#include <tally/testing/fake_remote.hpp>

namespace {

using tally::schema::entity_kind_t;
using tally::schema::error_code_t;
using tally::schema::field_t;
using tally::schema::outcome_status_t;
using tally::testing::make_request;
using tally::testing::transaction;

}  // namespace

TEST(mutation_planner, writes_only_fields_that_differ) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::reviewed, tally::testing::boolean(false)},
                                 {field_t::notes, tally::testing::text("keep")}});
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true)),
       tally::schema::set_field(field_t::notes, tally::testing::text("keep"))}));

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].status, outcome_status_t::applied);
  ASSERT_EQ(outcomes[0].changes.size(), 1u);
  EXPECT_EQ(outcomes[0].changes[0].field, field_t::reviewed);
  EXPECT_EQ(outcomes[0].changes[0].old_value, tally::testing::boolean(false));
  EXPECT_EQ(outcomes[0].changes[0].new_value, tally::testing::boolean(true));
  EXPECT_EQ(outcomes[0].unchanged, std::vector<field_t>{field_t::notes});
  EXPECT_EQ(remote.get(transaction("t1"), field_t::reviewed),
            tally::testing::boolean(true));
}

TEST(mutation_planner, second_identical_request_is_a_no_op) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::reviewed, tally::testing::boolean(false)}});
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};
  auto request = make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))});

  EXPECT_EQ(planner.plan_and_apply(request)[0].status, outcome_status_t::applied);
  const auto writes = remote.writes();

  auto again = planner.plan_and_apply(request);
  EXPECT_EQ(again[0].status, outcome_status_t::skipped_no_op);
  EXPECT_TRUE(again[0].changes.empty());
  EXPECT_EQ(remote.writes(), writes);
}

TEST(mutation_planner, failures_stay_with_their_id) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("x"), {{field_t::reviewed, tally::testing::boolean(false)}});
  remote.put(transaction("z"), {{field_t::reviewed, tally::testing::boolean(false)}});
  remote.put(transaction("w"), {{field_t::reviewed, tally::testing::boolean(false)}});
  remote.fail_writes(transaction("w"));
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"x", "y", "w", "z"},
      {tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))}));

  ASSERT_EQ(outcomes.size(), 4u);
  EXPECT_EQ(outcomes[0].status, outcome_status_t::applied);
  EXPECT_EQ(outcomes[1].status, outcome_status_t::failed);
  EXPECT_EQ(outcomes[1].code, error_code_t::not_found);
  EXPECT_EQ(outcomes[2].status, outcome_status_t::failed);
  EXPECT_EQ(outcomes[2].code, error_code_t::write_failed);
  EXPECT_EQ(outcomes[2].detail, "service unavailable");
  EXPECT_TRUE(outcomes[2].changes.empty());
  EXPECT_EQ(outcomes[3].status, outcome_status_t::applied);
}

TEST(mutation_planner, read_failure_prevents_the_write) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::reviewed, tally::testing::boolean(false)}});
  remote.fail_reads(transaction("t1"));
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))}));

  EXPECT_EQ(outcomes[0].status, outcome_status_t::failed);
  EXPECT_EQ(outcomes[0].code, error_code_t::read_failed);
  EXPECT_EQ(remote.writes(), 0u);
}

TEST(mutation_planner, rejected_field_never_reaches_the_service) {
  auto remote = tally::testing::fake_remote{};
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1", "t2"},
      {tally::schema::set_field(field_t::frequency, tally::testing::text("DAILY"))}));

  ASSERT_EQ(outcomes.size(), 2u);
  for (const auto& outcome : outcomes) {
    EXPECT_EQ(outcome.status, outcome_status_t::failed);
    EXPECT_EQ(outcome.code, error_code_t::validation_rejected);
  }
  EXPECT_EQ(remote.reads(), 0u);
  EXPECT_EQ(remote.writes(), 0u);
}

TEST(mutation_planner, unknown_reference_is_rejected_locally) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::category_id, tally::testing::text("c1")}});
  auto capabilities = remote.capabilities();
  auto catalog = tally::execution::reference_catalog{};
  catalog.add(entity_kind_t::category, "c1");
  auto planner = tally::execution::mutation_planner{capabilities, &catalog};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::category_id, tally::testing::text("c9"))}));

  EXPECT_EQ(outcomes[0].code, error_code_t::validation_rejected);
  EXPECT_EQ(remote.reads(), 0u);
}

TEST(mutation_planner, preview_plans_exactly_what_apply_writes) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::tags, tally::testing::ids({"a"})},
                                 {field_t::reviewed, tally::testing::boolean(true)}});
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};
  auto request = make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::field_update{.field = field_t::tags,
                                   .mode = tally::schema::update_mode_t::add,
                                   .value = tally::testing::ids({"b"})},
       tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true))});

  auto planned = planner.preview(request);
  EXPECT_EQ(remote.writes(), 0u);
  EXPECT_EQ(remote.get(transaction("t1"), field_t::tags),
            tally::testing::ids({"a"}));

  auto applied = planner.plan_and_apply(request);
  ASSERT_EQ(planned.size(), applied.size());
  EXPECT_EQ(planned[0].status, applied[0].status);
  EXPECT_EQ(planned[0].changes, applied[0].changes);
  EXPECT_EQ(planned[0].unchanged, applied[0].unchanged);
  EXPECT_EQ(remote.get(transaction("t1"), field_t::tags),
            tally::testing::ids({"a", "b"}));
}

TEST(mutation_planner, partial_acceptance_keeps_reported_fields_only) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {{field_t::reviewed, tally::testing::boolean(false)},
                                 {field_t::notes, tally::testing::text("old")}});
  remote.accept_partially(transaction("t1"), {field_t::notes});
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::reviewed, tally::testing::boolean(true)),
       tally::schema::set_field(field_t::notes, tally::testing::text("new"))}));

  EXPECT_EQ(outcomes[0].status, outcome_status_t::failed);
  EXPECT_EQ(outcomes[0].code, error_code_t::write_failed);
  ASSERT_EQ(outcomes[0].changes.size(), 1u);
  EXPECT_EQ(outcomes[0].changes[0].field, field_t::notes);
}

TEST(mutation_planner, omitted_fields_read_as_unset) {
  auto remote = tally::testing::fake_remote{};
  remote.put(transaction("t1"), {});
  auto capabilities = remote.capabilities();
  auto planner = tally::execution::mutation_planner{capabilities};

  auto outcomes = planner.plan_and_apply(make_request(
      entity_kind_t::transaction, {"t1"},
      {tally::schema::set_field(field_t::notes, tally::testing::text(""))}));

  ASSERT_EQ(outcomes[0].changes.size(), 1u);
  EXPECT_FALSE(outcomes[0].changes[0].old_value.has_value());
}
