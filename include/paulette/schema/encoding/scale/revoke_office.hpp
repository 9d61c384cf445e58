#pragma once
#include <paulette/schema/revoke_office.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(revoke_office<1>&& o, ::scale::Encoder& encoder);
void decode(revoke_office<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
