#include <paulette/schema/encoding/scale/transaction.hpp>
#include <paulette/schema/encoding/scale/buy_office.hpp>
#include <paulette/schema/encoding/scale/initialize.hpp>
#include <paulette/schema/encoding/scale/new_office.hpp>
#include <paulette/schema/encoding/scale/pay_tax.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>
#include <paulette/schema/encoding/scale/revoke_office.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.invoker, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.invoker, decoder);
  decode(o.payload, decoder);
}

}  // namespace paulette::schema::encoding::scale
