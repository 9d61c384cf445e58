#pragma once
#include <paulette/schema/auction_parameters.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(auction_parameters<1>&& o, ::scale::Encoder& encoder);
void decode(auction_parameters<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
