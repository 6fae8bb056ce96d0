#pragma once
#include <registrar/schema/primitives.hpp>

#include <string>

// Schema type: update item.
// Registry workflow: issuer amendment of the mutable fields of an active
// item.
namespace registrar::schema {

template <uint16_t Version>
struct update_item;

template <>
struct update_item<1> final {
  uint16_t version{1};
  item_id_t id{};
  std::string metadata;
  height_t expiry{};
  std::string location;
};

using update_item_t = update_item<1>;

}  // namespace registrar::schema
