#include <paulette/schema/encoding/scale/for_sale_record.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(for_sale_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.auction_id, encoder);
}

void decode(for_sale_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.auction_id, decoder);
}

}  // namespace paulette::schema::encoding::scale
