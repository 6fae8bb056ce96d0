#pragma once

#include <registrar/schema/primitives.hpp>
#include <registrar/schema/registry_error_code.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

// Field validators shared by mint, update and the configuration setters.
// Each returns std::nullopt when the value is acceptable, otherwise the error
// code reported for that field.
namespace registrar::registry {

inline constexpr std::size_t kMaxMetadataLength = 100;
inline constexpr std::size_t kMaxSerialLength = 50;
inline constexpr std::size_t kMaxLocationLength = 50;
inline constexpr std::size_t kMaxCategoryLength = 30;

using check_result_t = std::optional<registrar::schema::registry_error_code>;

check_result_t check_metadata(std::string_view metadata);
check_result_t check_item_type(std::string_view item_type);

/// Expiry is measured against the height of the validating call, not the
/// height the item was minted at.
check_result_t check_expiry(registrar::schema::height_t expiry,
                            registrar::schema::height_t current_height);
check_result_t check_serial(std::string_view serial);

/// A location equal to the current default is accepted regardless of its
/// length; anything else must be 1 to 50 characters.
check_result_t check_location(std::string_view location,
                              std::string_view default_location);
check_result_t check_category(std::string_view category);

}  // namespace registrar::registry
