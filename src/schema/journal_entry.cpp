#include <tally/schema/journal_entry.hpp>

#include <algorithm>

namespace tally::schema {

entry_state_t overall_state(const journal_entry_t& entry) {
  const auto has = [&](const entry_state_t state) {
    return std::ranges::find(entry.field_states, state) !=
           std::end(entry.field_states);
  };
  if (has(entry_state_t::applied)) {
    return entry_state_t::applied;
  }
  if (has(entry_state_t::undone)) {
    return entry_state_t::undone;
  }
  return entry_state_t::superseded;
}

std::optional<std::size_t> find_change(const journal_entry_t& entry,
                                       const field_t field) {
  for (std::size_t i = 0; i < entry.changes.size(); ++i) {
    if (entry.changes[i].field == field) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<field_t> fields_in_state(const journal_entry_t& entry,
                                     const entry_state_t state) {
  auto fields = std::vector<field_t>{};
  for (std::size_t i = 0; i < entry.changes.size(); ++i) {
    if (i < entry.field_states.size() && entry.field_states[i] == state) {
      fields.push_back(entry.changes[i].field);
    }
  }
  return fields;
}

bool is_eligible(const journal_entry_t& entry) {
  return overall_state(entry) == entry_state_t::applied;
}

}  // namespace tally::schema
