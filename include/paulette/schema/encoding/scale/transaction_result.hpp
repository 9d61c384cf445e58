#pragma once
#include <paulette/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
