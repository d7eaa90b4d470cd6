#pragma once

#include <tally/schema/entity_ref.hpp>
#include <tally/schema/primitives.hpp>

#include <optional>
#include <string_view>

// Schema key type: journal keys.
// Canonical key prefixes and key codecs for the undo journal and the local
// fixture service. Integers are big-endian so lexical key order equals numeric
// order.
namespace tally::schema::key {

inline constexpr std::string_view kJournalSequenceKey{
    "SYS|JOURNAL|LAST_SEQUENCE"};
inline constexpr std::string_view kJournalEntryPrefix{"SYS|JOURNAL|ENTRY|"};
inline constexpr std::string_view kJournalEntityPrefix{"SYS|JOURNAL|ENTITY|"};
inline constexpr std::string_view kFixtureEntityPrefix{"SYS|FIXTURE|ENTITY|"};

tally::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const tally::schema::bytes_t& id);

tally::schema::bytes_t make_journal_entry_key(tally::schema::sequence_t sequence);

/// Prefix covering every index row of one entity.
tally::schema::bytes_t make_journal_entity_prefix(
    const tally::schema::entity_ref_t& ref);

tally::schema::bytes_t make_journal_entity_key(
    const tally::schema::entity_ref_t& ref,
    tally::schema::sequence_t sequence);

/// Sequence number carried by the trailing 8 bytes of an entry or index key.
std::optional<tally::schema::sequence_t> parse_trailing_sequence(
    const tally::schema::bytes_view_t& key);

tally::schema::bytes_t make_fixture_kind_prefix(tally::schema::entity_kind_t kind);

tally::schema::bytes_t make_fixture_entity_key(
    const tally::schema::entity_ref_t& ref);

}  // namespace tally::schema::key
