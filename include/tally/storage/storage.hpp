#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// Puts and deletes committed together in one synced write.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<tally::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  /// Return up to `limit` key-value pairs under prefix, highest key first.
  /// A limit of zero returns every pair.
  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const tally::schema::bytes_view_t& prefix,
      std::size_t limit) const;

  /// Atomically apply every put and delete in the batch.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete read-write storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing store read-only. Returns std::nullopt when nothing has
/// been written at path yet.
template <typename Library>
std::optional<storage<Library>> make_read_only_storage(
    const std::string_view& path);

}  // namespace tally::storage
