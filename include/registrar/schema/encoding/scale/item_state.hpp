#pragma once
#include <registrar/schema/item_state.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::item_state<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::item_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
