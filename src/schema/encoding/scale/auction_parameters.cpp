#include <paulette/schema/encoding/scale/auction_parameters.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(auction_parameters<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.start_price, encoder);
  encode(o.min_price, encoder);
  encode(o.slope, encoder);
}

void decode(auction_parameters<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.start_price, decoder);
  decode(o.min_price, decoder);
  decode(o.slope, decoder);
}

}  // namespace paulette::schema::encoding::scale
