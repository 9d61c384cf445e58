#include <paulette/schema/encoding/scale/initialize.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(initialize<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.admin, encoder);
  encode(o.token_id, encoder);
  encode(o.tax, encoder);
}

void decode(initialize<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.admin, decoder);
  decode(o.token_id, decoder);
  decode(o.tax, decoder);
}

}  // namespace paulette::schema::encoding::scale
