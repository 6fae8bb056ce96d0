#pragma once
#include <registrar/schema/item_type.hpp>
#include <registrar/schema/primitives.hpp>

#include <string>

// Schema type: item state.
// Registry workflow: authoritative record of one minted item. Serial,
// category, issuer and issued_at are fixed at mint; active only ever moves
// from true to false.
namespace registrar::schema {

template <uint16_t Version>
struct item_state;

template <>
struct item_state<1> final {
  uint16_t version{1};
  item_id_t id{};
  std::string metadata;
  item_type_t item_type{item_type_t::document};
  height_t expiry{};
  std::string serial;
  std::string location;
  std::string category;
  height_t issued_at{};
  identity_t issuer;
  bool active{true};
};

using item_state_t = item_state<1>;

}  // namespace registrar::schema
