#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(ed25519_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(secp256k1_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace paulette::schema::encoding::scale
