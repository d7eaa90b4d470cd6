#pragma once

#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/entity_ref.hpp>
#include <tally/schema/entry_state.hpp>
#include <tally/schema/field_change.hpp>
#include <tally/schema/journal_entry.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/file_lock.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tally::journal {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;
using storage_t =
    tally::storage::storage<tally::storage::rocksdb_storage_tag>;

struct append_options final {
  tally::schema::entry_origin_t origin{tally::schema::entry_origin_t::mutation};
  // State every field of the new entry starts in.
  tally::schema::entry_state_t initial_state{
      tally::schema::entry_state_t::applied};
  // Entry this one reverts. Its `reverted_fields` become Undone in the same
  // write instead of Superseded.
  std::optional<tally::schema::sequence_t> reverts;
  std::vector<tally::schema::field_t> reverted_fields;
};

/// Append-only, durable journal of applied field changes.
///
/// Writers are serialized by an advisory lock on `<path>.lock` (and a mutex
/// for threads sharing this handle); the database is opened read-write only
/// while that lock is held. Reads open the database read-only without taking
/// the lock; only a read whose open keeps racing a writer waits for it.
class journal_store final {
 public:
  class write_session;

  explicit journal_store(std::string path);

  journal_store(const journal_store&) = delete;
  journal_store& operator=(const journal_store&) = delete;

  const std::string& path() const { return path_; }

  /// Acquire the exclusive write lock and a fresh read-write view.
  write_session begin_write();

  /// Assign the next sequence and persist the entry. Every earlier entry
  /// whose (ref, field) is still Applied and is touched again is marked
  /// Superseded in the same write.
  tally::schema::sequence_t append(
      const tally::schema::entity_ref_t& ref,
      std::vector<tally::schema::field_change_t> changes,
      const append_options& options = {});

  /// Move every still-Applied field of the entry to `state`. Returns false
  /// when the sequence is unknown.
  bool mark(tally::schema::sequence_t sequence,
            tally::schema::entry_state_t state);

  /// Move the listed fields to `state`, where they are still Applied.
  bool mark(tally::schema::sequence_t sequence,
            const std::vector<tally::schema::field_t>& fields,
            tally::schema::entry_state_t state);

  std::optional<tally::schema::journal_entry_t> find(
      tally::schema::sequence_t sequence) const;

  /// Entries touching ref, most recent first.
  std::vector<tally::schema::journal_entry_t> entries_for(
      const tally::schema::entity_ref_t& ref) const;

  std::optional<tally::schema::journal_entry_t> last_entry() const;

  /// Most recent entry with at least one Applied field.
  std::optional<tally::schema::journal_entry_t> last_eligible_entry() const;

  /// Most recent entries first; a limit of zero lists everything.
  std::vector<tally::schema::journal_entry_t> list(std::size_t limit) const;

  /// Last assigned sequence, zero when nothing was ever appended.
  tally::schema::sequence_t last_sequence() const;

 private:
  std::optional<storage_t> open_reader() const;

  std::string path_;
  std::mutex mutex_;
};

/// Exclusive read-write view of the journal. Reads through a session see
/// every write committed before it was opened.
class journal_store::write_session final {
 public:
  write_session(write_session&&) = default;
  write_session& operator=(write_session&&) = delete;
  write_session(const write_session&) = delete;
  write_session& operator=(const write_session&) = delete;

  std::optional<tally::schema::journal_entry_t> find(
      tally::schema::sequence_t sequence) const;
  std::optional<tally::schema::journal_entry_t> last_eligible_entry() const;

  tally::schema::sequence_t append(
      const tally::schema::entity_ref_t& ref,
      std::vector<tally::schema::field_change_t> changes,
      const append_options& options = {});

  bool mark(tally::schema::sequence_t sequence,
            const std::vector<tally::schema::field_t>& fields,
            tally::schema::entry_state_t state);

 private:
  friend class journal_store;
  explicit write_session(journal_store& store);

  std::unique_lock<std::mutex> guard_;
  tally::storage::file_lock lock_;
  storage_t storage_;
  mutable encoder_t encoder_;
};

}  // namespace tally::journal
