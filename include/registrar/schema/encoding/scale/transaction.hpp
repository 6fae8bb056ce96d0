#pragma once
#include <registrar/schema/transaction.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::transaction<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
