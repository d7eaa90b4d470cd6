#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class error_code_t : uint32_t {
  none = 0,
  validation_rejected = 1,
  not_found = 2,
  read_failed = 3,
  write_failed = 4,
  conflict = 5,
  no_history = 6,
  already_undone = 7,
  superseded = 8,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"ok", error_code_t::none},
    std::pair<std::string_view, error_code_t>{
        "validation_rejected", error_code_t::validation_rejected},
    std::pair<std::string_view, error_code_t>{"not_found",
                                              error_code_t::not_found},
    std::pair<std::string_view, error_code_t>{"read_failed",
                                              error_code_t::read_failed},
    std::pair<std::string_view, error_code_t>{"write_failed",
                                              error_code_t::write_failed},
    std::pair<std::string_view, error_code_t>{"conflict",
                                              error_code_t::conflict},
    std::pair<std::string_view, error_code_t>{"no_history",
                                              error_code_t::no_history},
    std::pair<std::string_view, error_code_t>{"already_undone",
                                              error_code_t::already_undone},
    std::pair<std::string_view, error_code_t>{"superseded",
                                              error_code_t::superseded}};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace tally::schema
