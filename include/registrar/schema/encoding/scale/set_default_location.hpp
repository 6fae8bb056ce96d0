#pragma once
#include <registrar/schema/set_default_location.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::set_default_location<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::set_default_location<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
