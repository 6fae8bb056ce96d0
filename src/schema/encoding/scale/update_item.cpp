#include <registrar/schema/encoding/scale/update_item.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(update_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.metadata, encoder);
  encode(o.expiry, encoder);
  encode(o.location, encoder);
}

void decode(update_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.metadata, decoder);
  decode(o.expiry, decoder);
  decode(o.location, decoder);
}

}  // namespace registrar::schema::encoding::scale
