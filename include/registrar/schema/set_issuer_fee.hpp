#pragma once
#include <registrar/schema/primitives.hpp>

namespace registrar::schema {

template <uint16_t Version>
struct set_issuer_fee;

template <>
struct set_issuer_fee<1> final {
  uint16_t version{1};
  amount_t fee{};
};

using set_issuer_fee_t = set_issuer_fee<1>;

}  // namespace registrar::schema
