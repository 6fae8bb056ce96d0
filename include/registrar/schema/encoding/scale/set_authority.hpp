#pragma once
#include <registrar/schema/set_authority.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::set_authority<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::set_authority<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
