#include <tally/schema/field_value.hpp>
#include <tally/schema/primitives.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>

namespace tally::schema {

value_type_t value_type_of(const field_value_t& value) {
  return std::visit(
      overloaded{[](const bool&) { return value_type_t::boolean; },
                 [](const int64_t&) { return value_type_t::integer; },
                 [](const std::string&) { return value_type_t::text; },
                 [](const id_set_t&) { return value_type_t::id_set; }},
      value);
}

std::string_view to_string(const value_type_t value) {
  switch (value) {
    case value_type_t::boolean:
      return "boolean";
    case value_type_t::integer:
      return "integer";
    case value_type_t::text:
      return "text";
    case value_type_t::id_set:
      return "id-set";
  }
  return "unknown";
}

id_set_t make_id_set(std::vector<std::string> ids) {
  std::ranges::sort(ids);
  auto last = std::unique(std::begin(ids), std::end(ids));
  ids.erase(last, std::end(ids));
  return ids;
}

optional_field_value_t normalize(optional_field_value_t value) {
  if (!value.has_value()) {
    return value;
  }
  if (auto* ids = std::get_if<id_set_t>(&*value)) {
    *ids = make_id_set(std::move(*ids));
  }
  return value;
}

bool values_equal(const optional_field_value_t& lhs,
                  const optional_field_value_t& rhs) {
  return normalize(lhs) == normalize(rhs);
}

std::string to_display(const optional_field_value_t& value) {
  if (!value.has_value()) {
    return "<unset>";
  }
  return std::visit(
      overloaded{[](const bool& v) { return std::string{v ? "true" : "false"}; },
                 [](const int64_t& v) { return std::to_string(v); },
                 [](const std::string& v) { return "\"" + v + "\""; },
                 [](const id_set_t& v) {
                   auto out = std::string{"["};
                   for (std::size_t i = 0; i < v.size(); ++i) {
                     if (i != 0) {
                       out += ", ";
                     }
                     out += v[i];
                   }
                   out += "]";
                   return out;
                 }},
      *value);
}

std::optional<optional_field_value_t> parse_field_value(
    const std::string_view text,
    const value_type_t type) {
  if (text == "-") {
    return optional_field_value_t{};
  }
  switch (type) {
    case value_type_t::boolean:
      if (text == "true") {
        return optional_field_value_t{field_value_t{true}};
      }
      if (text == "false") {
        return optional_field_value_t{field_value_t{false}};
      }
      return std::nullopt;
    case value_type_t::integer: {
      auto parsed = int64_t{};
      auto [end, error] =
          std::from_chars(text.data(), text.data() + text.size(), parsed);
      if (error != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
      }
      return optional_field_value_t{field_value_t{parsed}};
    }
    case value_type_t::text:
      return optional_field_value_t{field_value_t{std::string{text}}};
    case value_type_t::id_set: {
      auto ids = std::vector<std::string>{};
      auto rest = text;
      while (!rest.empty()) {
        auto comma = rest.find(',');
        auto item = rest.substr(0, comma);
        if (!item.empty()) {
          ids.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
          break;
        }
        rest.remove_prefix(comma + 1);
      }
      return optional_field_value_t{field_value_t{make_id_set(std::move(ids))}};
    }
  }
  return std::nullopt;
}

}  // namespace tally::schema
