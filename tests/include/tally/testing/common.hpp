#pragma once

#include <tally/schema/field_value.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace tally::testing {

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
  std::filesystem::remove(path + ".lock", error);
}

inline tally::schema::optional_field_value_t text(std::string value) {
  return tally::schema::field_value_t{std::move(value)};
}

inline tally::schema::optional_field_value_t boolean(const bool value) {
  return tally::schema::field_value_t{value};
}

inline tally::schema::optional_field_value_t amount(const int64_t value) {
  return tally::schema::field_value_t{value};
}

inline tally::schema::optional_field_value_t ids(
    std::vector<std::string> values) {
  return tally::schema::field_value_t{
      tally::schema::make_id_set(std::move(values))};
}

}  // namespace tally::testing
