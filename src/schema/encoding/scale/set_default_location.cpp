#include <registrar/schema/encoding/scale/set_default_location.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(set_default_location<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.location, encoder);
}

void decode(set_default_location<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.location, decoder);
}

}  // namespace registrar::schema::encoding::scale
