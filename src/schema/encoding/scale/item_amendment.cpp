#include <registrar/schema/encoding/scale/item_amendment.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(item_amendment<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.metadata, encoder);
  encode(o.expiry, encoder);
  encode(o.location, encoder);
  encode(o.updated_at, encoder);
  encode(o.updater, encoder);
}

void decode(item_amendment<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.metadata, decoder);
  decode(o.expiry, decoder);
  decode(o.location, decoder);
  decode(o.updated_at, decoder);
  decode(o.updater, decoder);
}

}  // namespace registrar::schema::encoding::scale
