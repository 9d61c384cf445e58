#include <paulette/schema/encoding/scale/history_entry.hpp>

using namespace paulette::schema;

namespace paulette::schema::encoding::scale {

void encode(history_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.timestamp, encoder);
  encode(o.code, encoder);
  encode(o.tx, encoder);
}

void decode(history_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.timestamp, decoder);
  decode(o.code, decoder);
  decode(o.tx, decoder);
}

}  // namespace paulette::schema::encoding::scale
