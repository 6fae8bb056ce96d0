#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: registry error code.
// Registry workflow: one code per validation or authorization rule. Values are
// stable and surface as transaction result codes.
namespace registrar::schema {

enum class registry_error_code : uint32_t {
  unauthorized = 1000,
  invalid_metadata = 1001,
  invalid_item_type = 1002,
  invalid_issuer_fee = 1004,
  item_already_exists = 1005,
  max_items_exceeded = 1006,
  authority_not_set = 1007,
  invalid_location = 1008,
  invalid_category = 1009,
  invalid_serial = 1010,
  expiry_past = 1011,
  update_not_allowed = 1012,
  invalid_update = 1013,
  authority_already_set = 1014,
  // Missing id on update or deactivate. Hosts may expect invalid_update (1013)
  // here; that code is reserved and no longer produced.
  item_not_found = 1015,
  fee_transfer_failed = 1016,
};

inline constexpr auto kRegistryErrorCodeMappings = std::array{
    std::pair<std::string_view, registry_error_code>{
        "unauthorized", registry_error_code::unauthorized},
    std::pair<std::string_view, registry_error_code>{
        "invalid_metadata", registry_error_code::invalid_metadata},
    std::pair<std::string_view, registry_error_code>{
        "invalid_item_type", registry_error_code::invalid_item_type},
    std::pair<std::string_view, registry_error_code>{
        "invalid_issuer_fee", registry_error_code::invalid_issuer_fee},
    std::pair<std::string_view, registry_error_code>{
        "item_already_exists", registry_error_code::item_already_exists},
    std::pair<std::string_view, registry_error_code>{
        "max_items_exceeded", registry_error_code::max_items_exceeded},
    std::pair<std::string_view, registry_error_code>{
        "authority_not_set", registry_error_code::authority_not_set},
    std::pair<std::string_view, registry_error_code>{
        "invalid_location", registry_error_code::invalid_location},
    std::pair<std::string_view, registry_error_code>{
        "invalid_category", registry_error_code::invalid_category},
    std::pair<std::string_view, registry_error_code>{
        "invalid_serial", registry_error_code::invalid_serial},
    std::pair<std::string_view, registry_error_code>{
        "expiry_past", registry_error_code::expiry_past},
    std::pair<std::string_view, registry_error_code>{
        "update_not_allowed", registry_error_code::update_not_allowed},
    std::pair<std::string_view, registry_error_code>{
        "invalid_update", registry_error_code::invalid_update},
    std::pair<std::string_view, registry_error_code>{
        "authority_already_set", registry_error_code::authority_already_set},
    std::pair<std::string_view, registry_error_code>{
        "item_not_found", registry_error_code::item_not_found},
    std::pair<std::string_view, registry_error_code>{
        "fee_transfer_failed", registry_error_code::fee_transfer_failed},
};

inline constexpr std::string_view to_string(const registry_error_code value) {
  return to_string(value, kRegistryErrorCodeMappings).value_or("unknown");
}

}  // namespace registrar::schema
