#include <registrar/schema/encoding/scale/set_max_items.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(set_max_items<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.max_items, encoder);
}

void decode(set_max_items<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.max_items, decoder);
}

}  // namespace registrar::schema::encoding::scale
