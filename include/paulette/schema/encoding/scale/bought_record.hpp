#pragma once
#include <paulette/schema/bought_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(bought_record<1>&& o, ::scale::Encoder& encoder);
void decode(bought_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
