#pragma once
#include <registrar/schema/primitives.hpp>

// Schema type: set authority.
// Registry workflow: one-time bootstrap of the fee recipient and
// configuration administrator.
namespace registrar::schema {

template <uint16_t Version>
struct set_authority;

template <>
struct set_authority<1> final {
  uint16_t version{1};
  identity_t authority;
};

using set_authority_t = set_authority<1>;

}  // namespace registrar::schema
