#include <registrar/schema/encoding/scale/registry_config.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(registry_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.next_item_id, encoder);
  encode(o.max_items, encoder);
  encode(o.issuer_fee, encoder);
  encode(o.authority, encoder);
  encode(o.default_location, encoder);
}

void decode(registry_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.next_item_id, decoder);
  decode(o.max_items, decoder);
  decode(o.issuer_fee, decoder);
  decode(o.authority, decoder);
  decode(o.default_location, decoder);
}

}  // namespace registrar::schema::encoding::scale
