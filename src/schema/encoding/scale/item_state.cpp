#include <registrar/schema/encoding/scale/item_state.hpp>
#include <registrar/schema/encoding/scale/item_type.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(item_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.metadata, encoder);
  encode(o.item_type, encoder);
  encode(o.expiry, encoder);
  encode(o.serial, encoder);
  encode(o.location, encoder);
  encode(o.category, encoder);
  encode(o.issued_at, encoder);
  encode(o.issuer, encoder);
  encode(o.active, encoder);
}

void decode(item_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.metadata, decoder);
  decode(o.item_type, decoder);
  decode(o.expiry, decoder);
  decode(o.serial, decoder);
  decode(o.location, decoder);
  decode(o.category, decoder);
  decode(o.issued_at, decoder);
  decode(o.issuer, decoder);
  decode(o.active, decoder);
}

}  // namespace registrar::schema::encoding::scale
