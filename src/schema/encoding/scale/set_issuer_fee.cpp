#include <registrar/schema/encoding/scale/set_issuer_fee.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(set_issuer_fee<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fee, encoder);
}

void decode(set_issuer_fee<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fee, decoder);
}

}  // namespace registrar::schema::encoding::scale
