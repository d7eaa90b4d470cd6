#include <tally/schema/encoding/scale/field_change.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

void encode(field_change<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.field, encoder);
  encode(o.old_value, encoder);
  encode(o.new_value, encoder);
}

void decode(field_change<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.field, decoder);
  decode(o.old_value, decoder);
  decode(o.new_value, decoder);
}

}  // namespace tally::schema::encoding::scale
