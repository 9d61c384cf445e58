#pragma once
#include <paulette/schema/authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace paulette::schema::encoding::scale {

void encode(invoker_authorization_t&& o, ::scale::Encoder& encoder);
void decode(invoker_authorization_t&& o, ::scale::Decoder& decoder);

void encode(signed_authorization<1>&& o, ::scale::Encoder& encoder);
void decode(signed_authorization<1>&& o, ::scale::Decoder& decoder);

}  // namespace paulette::schema::encoding::scale
