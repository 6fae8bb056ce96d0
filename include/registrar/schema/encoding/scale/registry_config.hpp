#pragma once
#include <registrar/schema/registry_config.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::registry_config<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::registry_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
