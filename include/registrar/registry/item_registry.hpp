#pragma once

#include <registrar/registry/amendment_log.hpp>
#include <registrar/registry/config_store.hpp>
#include <registrar/registry/operation_context.hpp>
#include <registrar/registry/operation_result.hpp>
#include <registrar/registry/value_transfer.hpp>
#include <registrar/schema/deactivate_item.hpp>
#include <registrar/schema/item_amendment.hpp>
#include <registrar/schema/item_state.hpp>
#include <registrar/schema/item_type.hpp>
#include <registrar/schema/mint_item.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/update_item.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::registry {

/// Ids kept per item type in the type index. When a type is full the oldest
/// id is evicted (logged and reported on the mint event), so the list is a
/// recent-window view rather than a complete one.
inline constexpr std::size_t kTypeIndexCapacity = 100;

/// Registry of minted items and their serial and type indexes.
///
/// Entry points validate in a fixed order and stop at the first failing
/// rule. All writes of an entry point happen after its last check, so a
/// rejected operation leaves the registry, the configuration and the
/// amendment log untouched.
class item_registry final {
 public:
  using items_t =
      std::map<registrar::schema::item_id_t, registrar::schema::item_state_t>;
  using serial_index_t =
      std::map<std::string, registrar::schema::item_id_t, std::less<>>;
  using type_index_t = std::map<registrar::schema::item_type_t,
                                std::vector<registrar::schema::item_id_t>>;

  item_registry(config_store& config,
                amendment_log& amendments,
                value_transfer_t transfer = {});

  /// Install the host value transfer used to collect the issuer fee.
  void set_value_transfer(value_transfer_t transfer);

  /// Mint a new item and return its id.
  ///
  /// Order of checks: capacity, metadata, item type, expiry, serial,
  /// location, category, serial uniqueness, authority. The issuer fee is
  /// then transferred from the caller to the authority; a refused transfer
  /// aborts the mint with `fee_transfer_failed`.
  operation_result<registrar::schema::item_id_t> mint(
      const operation_context& context,
      const registrar::schema::mint_item_t& request);

  /// Amend metadata, expiry and location of an active item. Only the issuer
  /// may update; the amendment log keeps the new values.
  operation_result<bool> update(const operation_context& context,
                                const registrar::schema::update_item_t& request);

  /// Mark an item inactive. Repeating it on an inactive item succeeds.
  operation_result<bool> deactivate(
      const operation_context& context,
      const registrar::schema::deactivate_item_t& request);

  std::optional<registrar::schema::item_state_t> find_item(
      registrar::schema::item_id_t id) const;
  std::optional<registrar::schema::item_amendment_t> find_amendment(
      registrar::schema::item_id_t id) const;
  std::optional<std::vector<registrar::schema::item_id_t>> items_by_type(
      std::string_view item_type) const;
  std::optional<registrar::schema::item_id_t> find_item_by_serial(
      std::string_view serial) const;
  bool is_serial_registered(std::string_view serial) const;
  uint64_t item_count() const;

  const items_t& items() const;
  const serial_index_t& serial_index() const;
  const type_index_t& type_index() const;

  /// Replace records and indexes with previously persisted values.
  void restore(items_t items, serial_index_t serials, type_index_t types);

 private:
  config_store& config_;
  amendment_log& amendments_;
  value_transfer_t transfer_;
  items_t items_;
  serial_index_t serial_index_;
  type_index_t type_index_;
};

}  // namespace registrar::registry
