#include <registrar/registry/config_store.hpp>
#include <registrar/registry/validation.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace registrar::schema;

namespace registrar::registry {

namespace {

// Lower bound of the issuer fee. Kept as an explicit check although an
// unsigned fee can never fall below it.
inline constexpr amount_t kMinIssuerFee = 0;

}  // namespace

config_store::config_store(registry_config_t config)
    : config_{std::move(config)} {}

operation_result<bool> config_store::set_authority(const identity_t& authority) {
  if (config_.authority.has_value()) {
    spdlog::debug("Rejecting authority '{}': authority already set to '{}'",
                  authority, *config_.authority);
    return operation_result<bool>::failure(
        registry_error_code::authority_already_set);
  }
  config_.authority = authority;
  spdlog::info("Registry authority set to '{}'", authority);
  return operation_result<bool>::success(true);
}

operation_result<bool> config_store::set_issuer_fee(const amount_t fee) {
  if (!has_authority()) {
    return operation_result<bool>::failure(
        registry_error_code::authority_not_set);
  }
  if (fee < kMinIssuerFee) {
    return operation_result<bool>::failure(
        registry_error_code::invalid_issuer_fee);
  }
  config_.issuer_fee = fee;
  spdlog::info("Issuer fee set to {}", fee);
  return operation_result<bool>::success(true);
}

operation_result<bool> config_store::set_max_items(const uint64_t max_items) {
  if (!has_authority()) {
    return operation_result<bool>::failure(
        registry_error_code::authority_not_set);
  }
  if (max_items == 0) {
    return operation_result<bool>::failure(registry_error_code::invalid_update);
  }
  config_.max_items = max_items;
  spdlog::info("Max items set to {}", max_items);
  return operation_result<bool>::success(true);
}

operation_result<bool> config_store::set_default_location(
    const std::string_view location) {
  if (!has_authority()) {
    return operation_result<bool>::failure(
        registry_error_code::authority_not_set);
  }
  if (auto error = check_location(location, config_.default_location)) {
    return operation_result<bool>::failure(*error);
  }
  config_.default_location = std::string{location};
  spdlog::info("Default location set to '{}'", config_.default_location);
  return operation_result<bool>::success(true);
}

const registry_config_t& config_store::config() const {
  return config_;
}

bool config_store::has_authority() const {
  return config_.authority.has_value();
}

item_id_t config_store::allocate_item_id() {
  return config_.next_item_id++;
}

void config_store::restore(registry_config_t config) {
  config_ = std::move(config);
}

}  // namespace registrar::registry
