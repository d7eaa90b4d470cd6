#pragma once
#include <tally/schema/entity_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema::encoding::scale {

void encode(entity_record<1>&& o, ::scale::Encoder& encoder);
void decode(entity_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace tally::schema::encoding::scale
