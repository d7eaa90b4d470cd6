#pragma once

#include <tally/execution/remote.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/field.hpp>

#include <vector>

namespace tally::execution {

/// Read the current value of exactly `fields` for ref.
///
/// On success `values` holds one entry per requested field; a field the
/// service omitted is reported unset. not_found and read_failed propagate
/// unchanged and are never retried.
read_result capture(const read_fields_t& read_fields,
                    const tally::schema::entity_ref_t& ref,
                    const std::vector<tally::schema::field_t>& fields);

}  // namespace tally::execution
