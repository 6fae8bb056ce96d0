#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: item type.
// Registry workflow: closed set of physical item kinds accepted at mint and
// used as the key of the type index.
namespace registrar::schema {

enum class item_type_t : uint8_t {
  passport = 0,
  visa = 1,
  aid_kit = 2,
  document = 3
};

inline constexpr auto kItemTypeMappings = std::array{
    std::pair<std::string_view, item_type_t>{"passport",
                                             item_type_t::passport},
    std::pair<std::string_view, item_type_t>{"visa", item_type_t::visa},
    std::pair<std::string_view, item_type_t>{"aid-kit", item_type_t::aid_kit},
    std::pair<std::string_view, item_type_t>{"document",
                                             item_type_t::document},
};

template <>
inline std::optional<item_type_t> try_from_string<item_type_t>(
    const std::string_view value) {
  return from_string(value, kItemTypeMappings);
}

inline constexpr std::string_view to_string(const item_type_t value) {
  return to_string(value, kItemTypeMappings).value_or("unknown");
}

}  // namespace registrar::schema
