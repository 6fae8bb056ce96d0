#pragma once
#include <registrar/schema/primitives.hpp>

#include <string>

// Schema type: set default location.
// Registry workflow: replaces the location substituted for an empty location
// at mint time.
namespace registrar::schema {

template <uint16_t Version>
struct set_default_location;

template <>
struct set_default_location<1> final {
  uint16_t version{1};
  std::string location;
};

using set_default_location_t = set_default_location<1>;

}  // namespace registrar::schema
