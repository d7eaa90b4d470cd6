#include <tally/schema/encoding/scale/entity_ref.hpp>
#include <tally/schema/encoding/scale/field_change.hpp>
#include <tally/schema/encoding/scale/journal_entry.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

void encode(journal_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.recorded_at, encoder);
  encode(o.ref, encoder);
  encode(o.changes, encoder);
  encode(o.field_states, encoder);
  encode(o.origin, encoder);
  encode(o.reverts, encoder);
}

void decode(journal_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.recorded_at, decoder);
  decode(o.ref, decoder);
  decode(o.changes, decoder);
  decode(o.field_states, decoder);
  decode(o.origin, decoder);
  decode(o.reverts, decoder);
}

}  // namespace tally::schema::encoding::scale
