#pragma once
#include <registrar/schema/primitives.hpp>

namespace registrar::schema {

template <uint16_t Version>
struct set_max_items;

template <>
struct set_max_items<1> final {
  uint16_t version{1};
  uint64_t max_items{};
};

using set_max_items_t = set_max_items<1>;

}  // namespace registrar::schema
