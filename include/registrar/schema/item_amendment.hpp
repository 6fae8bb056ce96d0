#pragma once
#include <registrar/schema/primitives.hpp>

#include <string>

// Schema type: item amendment.
// Registry workflow: most recent successful update of an item, overwritten
// on every update.
namespace registrar::schema {

template <uint16_t Version>
struct item_amendment;

template <>
struct item_amendment<1> final {
  uint16_t version{1};
  std::string metadata;
  height_t expiry{};
  std::string location;
  height_t updated_at{};
  identity_t updater;
};

using item_amendment_t = item_amendment<1>;

}  // namespace registrar::schema
