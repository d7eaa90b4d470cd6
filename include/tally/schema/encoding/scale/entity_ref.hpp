#pragma once
#include <tally/schema/entity_ref.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema::encoding::scale {

void encode(entity_ref<1>&& o, ::scale::Encoder& encoder);
void decode(entity_ref<1>&& o, ::scale::Decoder& decoder);

}  // namespace tally::schema::encoding::scale
