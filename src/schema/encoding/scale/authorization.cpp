#include <paulette/schema/encoding/scale/authorization.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

// Invoker mode carries no data; the variant index alone selects it.
void encode(invoker_authorization_t&&, ::scale::Encoder&) {}

void decode(invoker_authorization_t&&, ::scale::Decoder&) {}

void encode(signed_authorization<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
  encode(o.signature, encoder);
}

void decode(signed_authorization<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
  decode(o.signature, decoder);
}

}  // namespace paulette::schema::encoding::scale
