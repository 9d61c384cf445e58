#pragma once
#include <paulette/schema/initialize.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(initialize<1>&& o, ::scale::Encoder& encoder);
void decode(initialize<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
