#pragma once
#include <paulette/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
