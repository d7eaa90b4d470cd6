#pragma once
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/entity_record.hpp>
#include <tally/schema/encoding/scale/entity_ref.hpp>
#include <tally/schema/encoding/scale/field_change.hpp>
#include <tally/schema/encoding/scale/journal_entry.hpp>
#include <algorithm>
#include <string>
#include <scale/scale.hpp>

namespace tally::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

namespace detail {

/// Leading bytes of a record, enough to recognise it in tally.log.
inline std::string record_head(const tally::schema::bytes_view_t& bytes) {
  return tally::schema::to_hex(
      bytes.first(std::min<std::size_t>(bytes.size(), 16)));
}

}  // namespace detail

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tally::common::critical("cannot encode record for the journal");
  }
  return std::move(encoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const tally::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    tally::common::critical("cannot decode stored record",
                            detail::record_head(bytes),
                            std::to_string(bytes.size()) + " bytes");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace tally::schema::encoding
