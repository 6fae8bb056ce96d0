#pragma once
#include <registrar/schema/update_item.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::update_item<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::update_item<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
