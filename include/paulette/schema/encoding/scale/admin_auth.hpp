#pragma once
#include <paulette/schema/admin_auth.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(admin_auth<1>&& o, ::scale::Encoder& encoder);
void decode(admin_auth<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
