#pragma once
#include <registrar/schema/primitives.hpp>

#include <string>

// Schema type: mint item.
// Registry workflow: issuance request. The item type travels as its textual
// name so that unknown kinds reach the validation pipeline.
namespace registrar::schema {

template <uint16_t Version>
struct mint_item;

template <>
struct mint_item<1> final {
  uint16_t version{1};
  std::string metadata;
  std::string item_type;
  height_t expiry{};
  std::string serial;
  std::string location;
  std::string category;
};

using mint_item_t = mint_item<1>;

}  // namespace registrar::schema
