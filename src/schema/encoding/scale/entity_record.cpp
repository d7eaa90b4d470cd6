#include <tally/schema/encoding/scale/entity_record.hpp>
#include <tally/schema/encoding/scale/entity_ref.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

void encode(entity_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.ref, encoder);
  encode(o.fields, encoder);
}

void decode(entity_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.ref, decoder);
  decode(o.fields, decoder);
}

}  // namespace tally::schema::encoding::scale
