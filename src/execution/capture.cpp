#include <tally/execution/capture.hpp>

#include <spdlog/spdlog.h>

namespace tally::execution {

read_result capture(const read_fields_t& read_fields,
                    const tally::schema::entity_ref_t& ref,
                    const std::vector<tally::schema::field_t>& fields) {
  if (!read_fields) {
    return read_result{.code = tally::schema::error_code_t::read_failed,
                       .values = {},
                       .detail = "no read capability configured"};
  }

  auto raw = read_fields(ref, fields);
  if (raw.code != tally::schema::error_code_t::none) {
    spdlog::debug("capture {} failed: {} {}", tally::schema::to_display(ref),
                  tally::schema::to_string(raw.code), raw.detail);
    if (raw.detail.empty()) {
      raw.detail = std::string{tally::schema::to_string(raw.code)};
    }
    raw.values.clear();
    return raw;
  }

  auto result = read_result{};
  for (const auto field : fields) {
    auto it = raw.values.find(field);
    result.values[field] = it == std::end(raw.values)
                               ? tally::schema::optional_field_value_t{}
                               : tally::schema::normalize(it->second);
    spdlog::debug("capture {} {} = {}", tally::schema::to_display(ref),
                  tally::schema::to_string(field),
                  tally::schema::to_display(result.values[field]));
  }
  return result;
}

}  // namespace tally::execution
