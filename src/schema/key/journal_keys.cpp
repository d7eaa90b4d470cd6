#include <tally/schema/key/journal_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace tally::schema::key {

namespace {

void append_u32(tally::schema::bytes_t& out, const uint32_t value) {
  auto buffer = boost::endian::big_uint32_buf_t{value};
  out.insert(std::end(out), buffer.data(), buffer.data() + sizeof(uint32_t));
}

void append_u64(tally::schema::bytes_t& out, const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  out.insert(std::end(out), buffer.data(), buffer.data() + sizeof(uint64_t));
}

void append_ref(tally::schema::bytes_t& out,
                const tally::schema::entity_ref_t& ref) {
  out.push_back(static_cast<uint8_t>(ref.kind));
  append_u32(out, static_cast<uint32_t>(ref.id.size()));
  out.insert(std::end(out), std::begin(ref.id), std::end(ref.id));
}

}  // namespace

tally::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const tally::schema::bytes_t& id) {
  auto key = tally::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

tally::schema::bytes_t make_journal_entry_key(
    const tally::schema::sequence_t sequence) {
  auto suffix = tally::schema::bytes_t{};
  append_u64(suffix, sequence);
  return make_prefixed_key(kJournalEntryPrefix, suffix);
}

tally::schema::bytes_t make_journal_entity_prefix(
    const tally::schema::entity_ref_t& ref) {
  auto suffix = tally::schema::bytes_t{};
  append_ref(suffix, ref);
  return make_prefixed_key(kJournalEntityPrefix, suffix);
}

tally::schema::bytes_t make_journal_entity_key(
    const tally::schema::entity_ref_t& ref,
    const tally::schema::sequence_t sequence) {
  auto key = make_journal_entity_prefix(ref);
  append_u64(key, sequence);
  return key;
}

std::optional<tally::schema::sequence_t> parse_trailing_sequence(
    const tally::schema::bytes_view_t& key) {
  if (key.size() < sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::memcpy(buffer.data(), key.data() + key.size() - sizeof(uint64_t),
              sizeof(uint64_t));
  return buffer.value();
}

tally::schema::bytes_t make_fixture_kind_prefix(
    const tally::schema::entity_kind_t kind) {
  return make_prefixed_key(kFixtureEntityPrefix,
                           tally::schema::bytes_t{static_cast<uint8_t>(kind)});
}

tally::schema::bytes_t make_fixture_entity_key(
    const tally::schema::entity_ref_t& ref) {
  auto suffix = tally::schema::bytes_t{};
  append_ref(suffix, ref);
  return make_prefixed_key(kFixtureEntityPrefix, suffix);
}

}  // namespace tally::schema::key
