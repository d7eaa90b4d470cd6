#pragma once

#include <tally/schema/entity_ref.hpp>
#include <tally/schema/field.hpp>
#include <tally/schema/field_value.hpp>

#include <cstdint>
#include <utility>
#include <vector>

// Schema type: entity record.
// Stored field values of one entity held by the local fixture service.
namespace tally::schema {

using field_entry_t = std::pair<field_t, optional_field_value_t>;

template <uint16_t Version>
struct entity_record;

template <>
struct entity_record<1> final {
  uint16_t version{1};
  entity_ref_t ref;
  std::vector<field_entry_t> fields;
};

using entity_record_t = entity_record<1>;

}  // namespace tally::schema
