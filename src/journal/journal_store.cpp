#include <tally/common/critical.hpp>
#include <tally/journal/journal_store.hpp>
#include <tally/schema/key/journal_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <system_error>

namespace tally::journal {

namespace {

using tally::schema::entry_state_t;
using tally::schema::journal_entry_t;
using tally::schema::sequence_t;

std::optional<journal_entry_t> load_entry(const storage_t& storage,
                                          encoder_t& encoder,
                                          const sequence_t sequence) {
  auto key = tally::schema::key::make_journal_entry_key(sequence);
  return storage.get<encoder_t, journal_entry_t>(
      encoder, tally::schema::make_bytes_view(key));
}

sequence_t load_last_sequence(const storage_t& storage, encoder_t& encoder) {
  return storage
      .get<encoder_t, uint64_t>(
          encoder,
          tally::schema::make_bytes_view(tally::schema::key::kJournalSequenceKey))
      .value_or(0);
}

std::vector<journal_entry_t> decode_entries(
    const std::vector<tally::storage::key_value_entry_t>& rows,
    encoder_t& encoder) {
  auto entries = std::vector<journal_entry_t>{};
  entries.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    entries.push_back(encoder.decode<journal_entry_t>(
        tally::schema::make_bytes_view(value)));
  }
  return entries;
}

std::vector<journal_entry_t> load_recent(const storage_t& storage,
                                         encoder_t& encoder,
                                         const std::size_t limit) {
  auto prefix = tally::schema::make_bytes(tally::schema::key::kJournalEntryPrefix);
  return decode_entries(
      storage.list_by_prefix_reverse(tally::schema::make_bytes_view(prefix),
                                     limit),
      encoder);
}

std::vector<journal_entry_t> load_entries_for(
    const storage_t& storage,
    encoder_t& encoder,
    const tally::schema::entity_ref_t& ref) {
  auto prefix = tally::schema::key::make_journal_entity_prefix(ref);
  auto rows = storage.list_by_prefix_reverse(
      tally::schema::make_bytes_view(prefix), 0);
  auto entries = std::vector<journal_entry_t>{};
  entries.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    auto sequence = tally::schema::key::parse_trailing_sequence(
        tally::schema::make_bytes_view(key));
    if (!sequence.has_value()) {
      tally::common::critical("malformed entity index key in journal",
                              storage.path, tally::schema::to_hex(
                                               tally::schema::make_bytes_view(key)));
    }
    auto entry = load_entry(storage, encoder, *sequence);
    if (!entry.has_value()) {
      tally::common::critical(
          "entity index names a missing entry in journal", storage.path,
          "sequence " + std::to_string(*sequence));
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::optional<journal_entry_t> find_last_eligible(const storage_t& storage,
                                                  encoder_t& encoder) {
  for (auto& entry : load_recent(storage, encoder, 0)) {
    if (tally::schema::is_eligible(entry)) {
      return std::move(entry);
    }
  }
  return std::nullopt;
}

/// Move `fields` of entry from Applied to state. Returns true when any field
/// changed.
bool transition(journal_entry_t& entry,
                const std::vector<tally::schema::field_t>& fields,
                const entry_state_t state) {
  auto changed = false;
  for (std::size_t i = 0; i < entry.changes.size(); ++i) {
    if (entry.field_states[i] != entry_state_t::applied) {
      continue;
    }
    if (std::ranges::find(fields, entry.changes[i].field) == std::end(fields)) {
      continue;
    }
    entry.field_states[i] = state;
    changed = true;
  }
  return changed;
}

void stage_entry(tally::storage::write_batch& batch,
                 encoder_t& encoder,
                 const journal_entry_t& entry) {
  batch.puts.emplace_back(
      tally::schema::key::make_journal_entry_key(entry.sequence),
      encoder.encode(entry));
}

}  // namespace

journal_store::journal_store(std::string path) : path_{std::move(path)} {}

journal_store::write_session journal_store::begin_write() {
  return write_session{*this};
}

std::optional<storage_t> journal_store::open_reader() const {
  return tally::storage::make_read_only_storage<
      tally::storage::rocksdb_storage_tag>(path_);
}

tally::schema::sequence_t journal_store::append(
    const tally::schema::entity_ref_t& ref,
    std::vector<tally::schema::field_change_t> changes,
    const append_options& options) {
  auto session = begin_write();
  return session.append(ref, std::move(changes), options);
}

bool journal_store::mark(const tally::schema::sequence_t sequence,
                         const tally::schema::entry_state_t state) {
  auto session = begin_write();
  auto entry = session.find(sequence);
  if (!entry.has_value()) {
    return false;
  }
  auto fields = std::vector<tally::schema::field_t>{};
  for (const auto& change : entry->changes) {
    fields.push_back(change.field);
  }
  return session.mark(sequence, fields, state);
}

bool journal_store::mark(const tally::schema::sequence_t sequence,
                         const std::vector<tally::schema::field_t>& fields,
                         const tally::schema::entry_state_t state) {
  auto session = begin_write();
  return session.mark(sequence, fields, state);
}

std::optional<journal_entry_t> journal_store::find(
    const tally::schema::sequence_t sequence) const {
  auto reader = open_reader();
  if (!reader) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return load_entry(*reader, encoder, sequence);
}

std::vector<journal_entry_t> journal_store::entries_for(
    const tally::schema::entity_ref_t& ref) const {
  auto reader = open_reader();
  if (!reader) {
    return {};
  }
  auto encoder = encoder_t{};
  return load_entries_for(*reader, encoder, ref);
}

std::optional<journal_entry_t> journal_store::last_entry() const {
  auto recent = list(1);
  if (recent.empty()) {
    return std::nullopt;
  }
  return std::move(recent.front());
}

std::optional<journal_entry_t> journal_store::last_eligible_entry() const {
  auto reader = open_reader();
  if (!reader) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return find_last_eligible(*reader, encoder);
}

std::vector<journal_entry_t> journal_store::list(
    const std::size_t limit) const {
  auto reader = open_reader();
  if (!reader) {
    return {};
  }
  auto encoder = encoder_t{};
  return load_recent(*reader, encoder, limit);
}

tally::schema::sequence_t journal_store::last_sequence() const {
  auto reader = open_reader();
  if (!reader) {
    return 0;
  }
  auto encoder = encoder_t{};
  return load_last_sequence(*reader, encoder);
}

namespace {

std::string prepare_lock_path(const std::string& journal_path) {
  auto parent = std::filesystem::path{journal_path}.parent_path();
  if (!parent.empty()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(parent, error);
    if (error) {
      tally::common::critical("cannot create journal directory",
                              parent.string(), error.message());
    }
  }
  return tally::storage::lock_path_for(journal_path);
}

}  // namespace

journal_store::write_session::write_session(journal_store& store)
    : guard_{store.mutex_},
      lock_{prepare_lock_path(store.path_)},
      storage_{tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
          store.path_)} {}

std::optional<journal_entry_t> journal_store::write_session::find(
    const tally::schema::sequence_t sequence) const {
  return load_entry(storage_, encoder_, sequence);
}

std::optional<journal_entry_t>
journal_store::write_session::last_eligible_entry() const {
  return find_last_eligible(storage_, encoder_);
}

tally::schema::sequence_t journal_store::write_session::append(
    const tally::schema::entity_ref_t& ref,
    std::vector<tally::schema::field_change_t> changes,
    const append_options& options) {
  auto batch = tally::storage::write_batch{};

  auto touched = std::vector<tally::schema::field_t>{};
  touched.reserve(changes.size());
  for (const auto& change : changes) {
    touched.push_back(change.field);
  }

  // Each earlier entry is rewritten at most once, after both transitions.
  auto rewritten = std::map<sequence_t, journal_entry_t>{};
  for (auto& prior : load_entries_for(storage_, encoder_, ref)) {
    auto changed = false;
    if (options.reverts.has_value() && prior.sequence == *options.reverts) {
      changed = transition(prior, options.reverted_fields,
                           entry_state_t::undone);
    }
    changed = transition(prior, touched, entry_state_t::superseded) || changed;
    if (changed) {
      spdlog::debug("journal entry {} now {}", prior.sequence,
                    tally::schema::to_string(tally::schema::overall_state(prior)));
      rewritten.emplace(prior.sequence, std::move(prior));
    }
  }

  auto entry = journal_entry_t{};
  entry.sequence = load_last_sequence(storage_, encoder_) + 1;
  entry.recorded_at = tally::schema::now_milliseconds();
  entry.ref = ref;
  entry.field_states.assign(changes.size(), options.initial_state);
  entry.changes = std::move(changes);
  entry.origin = options.origin;
  entry.reverts = options.reverts;

  for (const auto& [sequence, prior] : rewritten) {
    stage_entry(batch, encoder_, prior);
  }
  stage_entry(batch, encoder_, entry);
  batch.puts.emplace_back(
      tally::schema::key::make_journal_entity_key(ref, entry.sequence),
      tally::schema::bytes_t{});
  batch.puts.emplace_back(
      tally::schema::make_bytes(tally::schema::key::kJournalSequenceKey),
      encoder_.encode(static_cast<uint64_t>(entry.sequence)));
  storage_.commit(batch);

  spdlog::info("journal appended {} for {} ({} field(s), {})", entry.sequence,
               tally::schema::to_display(ref), entry.changes.size(),
               tally::schema::to_string(entry.origin));
  return entry.sequence;
}

bool journal_store::write_session::mark(
    const tally::schema::sequence_t sequence,
    const std::vector<tally::schema::field_t>& fields,
    const tally::schema::entry_state_t state) {
  auto entry = load_entry(storage_, encoder_, sequence);
  if (!entry.has_value()) {
    return false;
  }
  if (transition(*entry, fields, state)) {
    auto batch = tally::storage::write_batch{};
    stage_entry(batch, encoder_, *entry);
    storage_.commit(batch);
    spdlog::info("journal entry {} marked {}", sequence,
                 tally::schema::to_string(state));
  }
  return true;
}

}  // namespace tally::journal
