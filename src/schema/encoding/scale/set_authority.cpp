#include <registrar/schema/encoding/scale/set_authority.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(set_authority<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authority, encoder);
}

void decode(set_authority<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authority, decoder);
}

}  // namespace registrar::schema::encoding::scale
