#include <tally/schema/encoding/scale/entity_ref.hpp>

using namespace tally::schema;

namespace tally::schema::encoding::scale {

void encode(entity_ref<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.kind, encoder);
  encode(o.id, encoder);
}

void decode(entity_ref<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.kind, decoder);
  decode(o.id, decoder);
}

}  // namespace tally::schema::encoding::scale
