#include <paulette/schema/encoding/scale/buy_office.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(buy_office<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.office_id, encoder);
  encode(o.buyer, encoder);
}

void decode(buy_office<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.office_id, decoder);
  decode(o.buyer, decoder);
}

}  // namespace paulette::schema::encoding::scale
