#pragma once
#include <tally/schema/field_change.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema::encoding::scale {

void encode(field_change<1>&& o, ::scale::Encoder& encoder);
void decode(field_change<1>&& o, ::scale::Decoder& decoder);

}  // namespace tally::schema::encoding::scale
