#include <tally/execution/change_model.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>

namespace tally::execution {

namespace {

using tally::schema::entity_kind_t;
using tally::schema::field_t;
using tally::schema::value_type_t;

const std::vector<field_spec>& transaction_fields() {
  static const auto fields = std::vector<field_spec>{
      field_spec{.field = field_t::reviewed, .type = value_type_t::boolean},
      field_spec{.field = field_t::category_id,
                 .type = value_type_t::text,
                 .references = entity_kind_t::category},
      field_spec{.field = field_t::tags,
                 .type = value_type_t::id_set,
                 .references = entity_kind_t::tag},
      field_spec{.field = field_t::notes,
                 .type = value_type_t::text,
                 .nullable = true},
      field_spec{.field = field_t::recurring_id,
                 .type = value_type_t::text,
                 .nullable = true,
                 .references = entity_kind_t::recurring},
      field_spec{.field = field_t::transaction_type,
                 .type = value_type_t::text,
                 .allowed_values = {"REGULAR", "INTERNAL_TRANSFER"}}};
  return fields;
}

const std::vector<field_spec>& category_fields() {
  static const auto fields = std::vector<field_spec>{
      field_spec{.field = field_t::name,
                 .type = value_type_t::text,
                 .non_empty = true},
      field_spec{.field = field_t::emoji,
                 .type = value_type_t::text,
                 .nullable = true},
      field_spec{.field = field_t::color_name,
                 .type = value_type_t::text,
                 .nullable = true},
      field_spec{.field = field_t::excluded, .type = value_type_t::boolean}};
  return fields;
}

const std::vector<field_spec>& tag_fields() {
  static const auto fields = std::vector<field_spec>{
      field_spec{.field = field_t::name,
                 .type = value_type_t::text,
                 .non_empty = true},
      field_spec{.field = field_t::color_name,
                 .type = value_type_t::text,
                 .nullable = true}};
  return fields;
}

const std::vector<field_spec>& recurring_fields() {
  static const auto fields = std::vector<field_spec>{
      field_spec{.field = field_t::name_contains,
                 .type = value_type_t::text,
                 .nullable = true},
      field_spec{.field = field_t::min_amount,
                 .type = value_type_t::integer,
                 .nullable = true,
                 .non_negative = true},
      field_spec{.field = field_t::max_amount,
                 .type = value_type_t::integer,
                 .nullable = true,
                 .non_negative = true},
      field_spec{.field = field_t::frequency,
                 .type = value_type_t::text,
                 .allowed_values = {"DAILY", "WEEKLY", "BIWEEKLY", "MONTHLY",
                                    "QUARTERLY", "ANNUALLY"}}};
  return fields;
}

validation_result reject(std::string reason) {
  return validation_result{.accepted = false, .reason = std::move(reason)};
}

validation_result check_reference(const field_spec& spec,
                                  const std::string& id,
                                  const reference_catalog* catalog) {
  if (!spec.references.has_value() || catalog == nullptr ||
      !catalog->covers(*spec.references)) {
    return {};
  }
  if (!catalog->contains(*spec.references, id)) {
    return reject(fmt::format("unknown {} id '{}'",
                              tally::schema::to_string(*spec.references), id));
  }
  return {};
}

}  // namespace

void reference_catalog::add(const entity_kind_t kind, std::string id) {
  ids_[kind].insert(std::move(id));
}

void reference_catalog::cover(const entity_kind_t kind) {
  ids_[kind];
}

bool reference_catalog::covers(const entity_kind_t kind) const {
  return ids_.contains(kind);
}

bool reference_catalog::contains(const entity_kind_t kind,
                                 const std::string& id) const {
  auto it = ids_.find(kind);
  return it != std::end(ids_) && it->second.contains(id);
}

std::span<const field_spec> mutable_fields(const entity_kind_t kind) {
  switch (kind) {
    case entity_kind_t::transaction:
      return transaction_fields();
    case entity_kind_t::category:
      return category_fields();
    case entity_kind_t::tag:
      return tag_fields();
    case entity_kind_t::recurring:
      return recurring_fields();
  }
  return {};
}

const field_spec* find_field(const entity_kind_t kind, const field_t field) {
  auto fields = mutable_fields(kind);
  auto it = std::ranges::find(fields, field, &field_spec::field);
  if (it == std::end(fields)) {
    return nullptr;
  }
  return &*it;
}

validation_result validate(
    const entity_kind_t kind,
    const field_t field,
    const tally::schema::optional_field_value_t& candidate,
    const reference_catalog* catalog,
    const validation_mode_t mode) {
  const auto* spec = find_field(kind, field);
  if (spec == nullptr) {
    return reject(fmt::format("field '{}' is not mutable on {}",
                              tally::schema::to_string(field),
                              tally::schema::to_string(kind)));
  }
  if (!candidate.has_value()) {
    if (!spec->nullable && mode == validation_mode_t::edit) {
      return reject(fmt::format("field '{}' cannot be cleared",
                                tally::schema::to_string(field)));
    }
    return {};
  }

  const auto actual_type = tally::schema::value_type_of(*candidate);
  if (actual_type != spec->type) {
    return reject(fmt::format("field '{}' expects {}, got {}",
                              tally::schema::to_string(field),
                              tally::schema::to_string(spec->type),
                              tally::schema::to_string(actual_type)));
  }
  if (mode == validation_mode_t::restore) {
    return {};
  }

  if (const auto* text = std::get_if<std::string>(&*candidate)) {
    if (spec->non_empty && text->empty()) {
      return reject(fmt::format("field '{}' cannot be empty",
                                tally::schema::to_string(field)));
    }
    if (!spec->allowed_values.empty() &&
        std::ranges::find(spec->allowed_values, std::string_view{*text}) ==
            std::end(spec->allowed_values)) {
      return reject(fmt::format("field '{}' does not accept '{}'",
                                tally::schema::to_string(field), *text));
    }
    return check_reference(*spec, *text, catalog);
  }
  if (const auto* amount = std::get_if<int64_t>(&*candidate)) {
    if (spec->non_negative && *amount < 0) {
      return reject(fmt::format("field '{}' must be >= 0",
                                tally::schema::to_string(field)));
    }
    return {};
  }
  if (const auto* ids = std::get_if<tally::schema::id_set_t>(&*candidate)) {
    for (const auto& id : *ids) {
      if (id.empty()) {
        return reject(fmt::format("field '{}' contains an empty id",
                                  tally::schema::to_string(field)));
      }
      auto result = check_reference(*spec, id, catalog);
      if (!result.accepted) {
        return result;
      }
    }
  }
  return {};
}

validation_result validate(const entity_kind_t kind,
                           const tally::schema::field_update& update,
                           const reference_catalog* catalog,
                           const validation_mode_t mode) {
  if (update.mode == tally::schema::update_mode_t::set) {
    return validate(kind, update.field, update.value, catalog, mode);
  }
  const auto* spec = find_field(kind, update.field);
  if (spec != nullptr && spec->type != value_type_t::id_set) {
    return reject(fmt::format("field '{}' does not support {}",
                              tally::schema::to_string(update.field),
                              tally::schema::to_string(update.mode)));
  }
  if (!update.value.has_value()) {
    return reject(fmt::format("{} on '{}' needs at least one id",
                              tally::schema::to_string(update.mode),
                              tally::schema::to_string(update.field)));
  }
  return validate(kind, update.field, update.value, catalog, mode);
}

tally::schema::optional_field_value_t resolve(
    const tally::schema::field_update& update,
    const tally::schema::optional_field_value_t& current) {
  if (update.mode == tally::schema::update_mode_t::set) {
    return tally::schema::normalize(update.value);
  }

  auto ids = tally::schema::id_set_t{};
  if (current.has_value()) {
    if (const auto* existing = std::get_if<tally::schema::id_set_t>(&*current)) {
      ids = *existing;
    }
  }
  auto operand = tally::schema::id_set_t{};
  if (update.value.has_value()) {
    if (const auto* given =
            std::get_if<tally::schema::id_set_t>(&*update.value)) {
      operand = *given;
    }
  }

  if (update.mode == tally::schema::update_mode_t::add) {
    ids.insert(std::end(ids), std::begin(operand), std::end(operand));
  } else {
    std::erase_if(ids, [&](const std::string& id) {
      return std::ranges::find(operand, id) != std::end(operand);
    });
  }
  return tally::schema::optional_field_value_t{
      tally::schema::field_value_t{tally::schema::make_id_set(std::move(ids))}};
}

}  // namespace tally::execution
