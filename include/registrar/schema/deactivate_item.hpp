#pragma once
#include <registrar/schema/primitives.hpp>

namespace registrar::schema {

template <uint16_t Version>
struct deactivate_item;

template <>
struct deactivate_item<1> final {
  uint16_t version{1};
  item_id_t id{};
};

using deactivate_item_t = deactivate_item<1>;

}  // namespace registrar::schema
