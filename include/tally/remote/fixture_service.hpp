#pragma once

#include <tally/execution/change_model.hpp>
#include <tally/execution/remote.hpp>
#include <tally/schema/entity_kind.hpp>
#include <tally/schema/entity_record.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/field_value.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tally::remote {

/// Local stand-in for the finance service: entity field values kept in a
/// RocksDB directory. Implements the field-level read/write capabilities the
/// engine consumes and supplies the reference catalog.
class fixture_service final {
 public:
  explicit fixture_service(std::string path);

  fixture_service(const fixture_service&) = delete;
  fixture_service& operator=(const fixture_service&) = delete;

  const std::string& path() const { return path_; }

  tally::execution::read_result read_fields(
      const tally::schema::entity_ref_t& ref,
      const std::vector<tally::schema::field_t>& fields) const;

  /// Fails with write_failed when the entity does not exist.
  tally::execution::write_result write_fields(
      const tally::schema::entity_ref_t& ref,
      const tally::schema::field_value_map_t& values);

  /// Create the entity if needed and set the given fields.
  void upsert(const tally::schema::entity_ref_t& ref,
              const tally::schema::field_value_map_t& values);

  std::optional<tally::schema::entity_record_t> load(
      const tally::schema::entity_ref_t& ref) const;

  std::vector<std::string> ids(tally::schema::entity_kind_t kind) const;

  /// Known ids for every kind that has at least one fixture entity.
  tally::execution::reference_catalog catalog() const;

  /// Capabilities bound to this instance; it must outlive them.
  tally::execution::remote_capabilities capabilities();

 private:
  std::string path_;
  std::mutex mutex_;
};

}  // namespace tally::remote
