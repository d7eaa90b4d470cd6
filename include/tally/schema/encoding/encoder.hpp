#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

// Build-time selected codec. Persisted types are encoded through this facade
// so the journal and the fixture service never name the codec library
// directly.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  /// Decode a record read back from a store. Bytes that do not decode mean
  /// the store is damaged, which is fatal.
  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
