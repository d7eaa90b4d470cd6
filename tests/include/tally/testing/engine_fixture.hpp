#pragma once

#include <tally/execution/engine.hpp>
#include <tally/journal/journal_store.hpp>
#include <tally/testing/common.hpp>
#include <tally/testing/fake_remote.hpp>

#include <set>
#include <string>
#include <string_view>

namespace tally::testing {

/// Fresh journal directory plus an engine wired to a fake remote.
class engine_fixture final {
 public:
  explicit engine_fixture(
      const std::string_view db_prefix,
      std::set<tally::schema::entity_kind_t> native_undo_kinds = {})
      : db_path_{make_db_path(db_prefix)},
        journal_{db_path_},
        capabilities_{remote_.capabilities(std::move(native_undo_kinds))},
        engine_{journal_, capabilities_, &catalog_} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  fake_remote& remote() { return remote_; }
  tally::execution::reference_catalog& catalog() { return catalog_; }
  tally::journal::journal_store& journal() { return journal_; }
  const tally::execution::remote_capabilities& capabilities() const {
    return capabilities_;
  }
  tally::execution::engine& engine() { return engine_; }

 private:
  std::string db_path_;
  fake_remote remote_;
  tally::execution::reference_catalog catalog_;
  tally::journal::journal_store journal_;
  tally::execution::remote_capabilities capabilities_;
  tally::execution::engine engine_;
};

inline tally::schema::entity_ref_t transaction(std::string id) {
  return tally::schema::make_entity_ref(
      tally::schema::entity_kind_t::transaction, std::move(id));
}

inline tally::schema::entity_ref_t category(std::string id) {
  return tally::schema::make_entity_ref(tally::schema::entity_kind_t::category,
                                        std::move(id));
}

inline tally::schema::mutation_request make_request(
    const tally::schema::entity_kind_t kind,
    std::vector<std::string> ids,
    std::vector<tally::schema::field_update> updates) {
  return tally::schema::mutation_request{
      .kind = kind, .ids = std::move(ids), .updates = std::move(updates)};
}

}  // namespace tally::testing
