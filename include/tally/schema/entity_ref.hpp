#pragma once

#include <tally/schema/entity_kind.hpp>

#include <compare>
#include <cstdint>
#include <string>

// Schema type: entity ref.
// Identity of a mutable remote object. Ids are opaque strings and are never
// reused across kinds.
namespace tally::schema {

template <uint16_t Version>
struct entity_ref;

template <>
struct entity_ref<1> final {
  uint16_t version{1};
  entity_kind_t kind{};
  std::string id;

  bool operator==(const entity_ref&) const = default;
  auto operator<=>(const entity_ref&) const = default;
};

using entity_ref_t = entity_ref<1>;

inline entity_ref_t make_entity_ref(const entity_kind_t kind, std::string id) {
  return entity_ref_t{.version = 1, .kind = kind, .id = std::move(id)};
}

inline std::string to_display(const entity_ref_t& ref) {
  auto out = std::string{to_string(ref.kind)};
  out.push_back(':');
  out += ref.id;
  return out;
}

}  // namespace tally::schema
