#include <paulette/schema/encoding/scale/admin_auth.hpp>
#include <paulette/schema/encoding/scale/authorization.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(admin_auth<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authorization, encoder);
  encode(o.nonce, encoder);
}

void decode(admin_auth<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authorization, decoder);
  decode(o.nonce, decoder);
}

}  // namespace paulette::schema::encoding::scale
