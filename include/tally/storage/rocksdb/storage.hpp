#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace tally::storage {

namespace detail {

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Smallest key greater than every key starting with prefix, or empty when no
/// such key exists (prefix is all 0xFF).
inline std::string prefix_successor(std::string prefix) {
  while (!prefix.empty()) {
    auto& last = prefix.back();
    if (static_cast<unsigned char>(last) != 0xFFu) {
      last = static_cast<char>(static_cast<unsigned char>(last) + 1);
      return prefix;
    }
    prefix.pop_back();
  }
  return prefix;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  // Directory the database lives in; named in fatal errors.
  std::string path;
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const tally::schema::bytes_view_t& prefix,
      std::size_t limit) const;
  void commit(const write_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
std::optional<storage<rocksdb_storage_tag>>
make_read_only_storage<rocksdb_storage_tag>(const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("store is not open", path, "no database handle");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      tally::common::critical("cannot read from", path, status.ToString());
    }
  }
  return {encoder.template decode<T>(tally::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tally::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    tally::common::critical("store is not open", path, "no database handle");
  }
  auto encoded_value = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options, detail::to_slice(key),
      detail::to_slice(tally::schema::bytes_view_t{encoded_value.data(),
                                                   encoded_value.size()}));
  if (!status.ok()) {
    tally::common::critical("cannot write to", path, status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  if (!database) {
    tally::common::critical("store is not open", path, "no database handle");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    tally::common::critical("cannot scan", path, iterator->status().ToString());
  }
  return entries;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix_reverse(
    const tally::schema::bytes_view_t& prefix,
    const std::size_t limit) const {
  if (!database) {
    tally::common::critical("store is not open", path, "no database handle");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto upper = detail::prefix_successor(prefix_string);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  if (upper.empty()) {
    iterator->SeekToLast();
  } else {
    iterator->SeekForPrev(upper);
  }
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (key_view.starts_with(prefix_string)) {
      entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                          detail::to_bytes(iterator->value())});
      if (limit != 0 && entries.size() >= limit) {
        break;
      }
    } else if (key_view < std::string_view{prefix_string}) {
      break;
    }
    iterator->Prev();
  }
  if (!iterator->status().ok()) {
    tally::common::critical("cannot scan", path, iterator->status().ToString());
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    tally::common::critical("store is not open", path, "no database handle");
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocks_batch.Delete(
        detail::to_slice(tally::schema::bytes_view_t{key.data(), key.size()}));
    if (!delete_status.ok()) {
      tally::common::critical("cannot stage delete for", path,
                              delete_status.ToString());
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(tally::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            tally::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      tally::common::critical("cannot stage put for", path,
                              put_status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &rocks_batch);
  if (!write_status.ok()) {
    tally::common::critical("cannot commit batch to", path,
                            write_status.ToString());
  }
}

}  // namespace tally::storage
