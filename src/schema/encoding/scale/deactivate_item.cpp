#include <registrar/schema/encoding/scale/deactivate_item.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(deactivate_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
}

void decode(deactivate_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
}

}  // namespace registrar::schema::encoding::scale
