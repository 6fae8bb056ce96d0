#include <registrar/schema/encoding/scale/deactivate_item.hpp>
#include <registrar/schema/encoding/scale/mint_item.hpp>
#include <registrar/schema/encoding/scale/set_authority.hpp>
#include <registrar/schema/encoding/scale/set_default_location.hpp>
#include <registrar/schema/encoding/scale/set_issuer_fee.hpp>
#include <registrar/schema/encoding/scale/set_max_items.hpp>
#include <registrar/schema/encoding/scale/transaction.hpp>
#include <registrar/schema/encoding/scale/update_item.hpp>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.caller, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.caller, decoder);
  decode(o.payload, decoder);
}

}  // namespace registrar::schema::encoding::scale
