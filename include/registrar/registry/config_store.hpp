#pragma once

#include <registrar/registry/operation_result.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/registry_config.hpp>

#include <string_view>

namespace registrar::registry {

/// Owner of the registry-wide parameters.
///
/// Every setter except `set_authority` requires the authority to be set
/// first. Setters only check that an authority exists, not who calls them.
/// Changes apply to subsequent operations and never to minted items.
class config_store final {
 public:
  explicit config_store(
      registrar::schema::registry_config_t config = {});

  /// Bootstrap the authority identity. Succeeds once.
  operation_result<bool> set_authority(
      const registrar::schema::identity_t& authority);

  operation_result<bool> set_issuer_fee(registrar::schema::amount_t fee);

  /// Reject a zero ceiling with `invalid_update`.
  operation_result<bool> set_max_items(uint64_t max_items);

  /// The new value runs through the location validator against the current
  /// default.
  operation_result<bool> set_default_location(std::string_view location);

  const registrar::schema::registry_config_t& config() const;
  bool has_authority() const;

  /// Hand out the next item id and advance the counter.
  registrar::schema::item_id_t allocate_item_id();

  /// Replace the whole configuration with previously persisted values.
  void restore(registrar::schema::registry_config_t config);

 private:
  registrar::schema::registry_config_t config_;
};

}  // namespace registrar::registry
