#include <registrar/schema/encoding/scale/mint_item.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(mint_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.metadata, encoder);
  encode(o.item_type, encoder);
  encode(o.expiry, encoder);
  encode(o.serial, encoder);
  encode(o.location, encoder);
  encode(o.category, encoder);
}

void decode(mint_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.metadata, decoder);
  decode(o.item_type, decoder);
  decode(o.expiry, decoder);
  decode(o.serial, decoder);
  decode(o.location, decoder);
  decode(o.category, decoder);
}

}  // namespace registrar::schema::encoding::scale
