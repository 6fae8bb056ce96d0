#pragma once
#include <registrar/schema/transaction_result.hpp>
#include <scale/scale.hpp>

namespace registrar::schema::encoding::scale {

void encode(registrar::schema::transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(registrar::schema::transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace registrar::schema::encoding::scale
