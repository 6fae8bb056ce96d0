#pragma once
#include <registrar/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: registry config.
// Registry workflow: process-wide parameters read by every validating
// operation and mutated only through the configuration setters.
namespace registrar::schema {

inline constexpr uint64_t kDefaultMaxItems = 5000;
inline constexpr amount_t kDefaultIssuerFee = 500;
inline constexpr std::string_view kDefaultLocation{"Global"};

template <uint16_t Version>
struct registry_config;

template <>
struct registry_config<1> final {
  uint16_t version{1};
  item_id_t next_item_id{};
  uint64_t max_items{kDefaultMaxItems};
  amount_t issuer_fee{kDefaultIssuerFee};
  std::optional<identity_t> authority;
  std::string default_location{kDefaultLocation};
};

using registry_config_t = registry_config<1>;

}  // namespace registrar::schema
