#pragma once
#include <paulette/schema/for_sale_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(for_sale_record<1>&& o, ::scale::Encoder& encoder);
void decode(for_sale_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
