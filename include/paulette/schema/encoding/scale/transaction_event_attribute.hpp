#pragma once
#include <paulette/schema/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
