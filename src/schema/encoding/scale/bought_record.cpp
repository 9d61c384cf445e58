#include <paulette/schema/encoding/scale/bought_record.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(bought_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.holder, encoder);
  encode(o.expires_at, encoder);
  encode(o.last_paid_at, encoder);
}

void decode(bought_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.holder, decoder);
  decode(o.expires_at, decoder);
  decode(o.last_paid_at, decoder);
}

}  // namespace paulette::schema::encoding::scale
