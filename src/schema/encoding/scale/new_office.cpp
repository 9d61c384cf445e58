#include <paulette/schema/encoding/scale/new_office.hpp>
#include <paulette/schema/encoding/scale/admin_auth.hpp>
#include <paulette/schema/encoding/scale/auction_parameters.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(new_office<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.auth, encoder);
  encode(o.office_id, encoder);
  encode(o.auction_id, encoder);
  encode(o.auction, encoder);
}

void decode(new_office<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.auth, decoder);
  decode(o.office_id, decoder);
  decode(o.auction_id, decoder);
  decode(o.auction, decoder);
}

}  // namespace paulette::schema::encoding::scale
