#pragma once
#include <paulette/schema/buy_office.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(buy_office<1>&& o, ::scale::Encoder& encoder);
void decode(buy_office<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
