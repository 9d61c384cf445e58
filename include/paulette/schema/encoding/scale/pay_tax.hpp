#pragma once
#include <paulette/schema/pay_tax.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(pay_tax<1>&& o, ::scale::Encoder& encoder);
void decode(pay_tax<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
