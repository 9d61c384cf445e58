#pragma once
#include <paulette/schema/new_office.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(new_office<1>&& o, ::scale::Encoder& encoder);
void decode(new_office<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
