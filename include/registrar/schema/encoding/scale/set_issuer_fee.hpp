#pragma once
#include <registrar/schema/set_issuer_fee.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::set_issuer_fee<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::set_issuer_fee<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
