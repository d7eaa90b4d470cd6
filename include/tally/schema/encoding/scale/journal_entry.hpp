#pragma once
#include <tally/schema/journal_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema::encoding::scale {

void encode(journal_entry<1>&& o, ::scale::Encoder& encoder);
void decode(journal_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace tally::schema::encoding::scale
