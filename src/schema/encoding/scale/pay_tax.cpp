#include <paulette/schema/encoding/scale/pay_tax.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(pay_tax<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.office_id, encoder);
  encode(o.payer, encoder);
}

void decode(pay_tax<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.office_id, decoder);
  decode(o.payer, decoder);
}

}  // namespace paulette::schema::encoding::scale
