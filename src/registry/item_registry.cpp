#include <registrar/registry/item_registry.hpp>
#include <registrar/registry/validation.hpp>
#include <registrar/schema/transaction_event.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <iterator>
#include <string>
#include <utility>

using namespace registrar::schema;

namespace registrar::registry {

namespace {

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_item_event(const std::string_view type,
                                    const item_id_t id) {
  return transaction_event_t{
      .type = std::string{type},
      .attributes = {make_attribute("id", std::to_string(id), true)}};
}

}  // namespace

item_registry::item_registry(config_store& config,
                             amendment_log& amendments,
                             value_transfer_t transfer)
    : config_{config},
      amendments_{amendments},
      transfer_{std::move(transfer)} {}

void item_registry::set_value_transfer(value_transfer_t transfer) {
  transfer_ = std::move(transfer);
}

operation_result<item_id_t> item_registry::mint(
    const operation_context& context,
    const mint_item_t& request) {
  using result_t = operation_result<item_id_t>;
  const auto& config = config_.config();

  if (config.next_item_id >= config.max_items) {
    return result_t::failure(registry_error_code::max_items_exceeded);
  }

  const auto checks = std::array{
      check_metadata(request.metadata),
      check_item_type(request.item_type),
      check_expiry(request.expiry, context.height),
      check_serial(request.serial),
      check_location(request.location, config.default_location),
      check_category(request.category)};
  for (const auto& check : checks) {
    if (check) {
      spdlog::debug("Mint of serial '{}' rejected: {}", request.serial,
                    to_string(*check));
      return result_t::failure(*check);
    }
  }

  if (serial_index_.contains(request.serial)) {
    spdlog::debug("Mint rejected: serial '{}' already registered",
                  request.serial);
    return result_t::failure(registry_error_code::item_already_exists);
  }
  if (!config.authority.has_value()) {
    return result_t::failure(registry_error_code::authority_not_set);
  }

  const auto fee = config.issuer_fee;
  const auto& authority = *config.authority;
  if (!transfer_ || !transfer_(fee, context.caller, authority)) {
    spdlog::warn("Issuer fee transfer of {} from '{}' to '{}' failed", fee,
                 context.caller, authority);
    return result_t::failure(registry_error_code::fee_transfer_failed);
  }

  // Past this point nothing can fail; every write below belongs to the same
  // operation.
  const auto item_type = *try_from_string<item_type_t>(request.item_type);
  const auto id = config_.allocate_item_id();
  auto item = item_state_t{
      .id = id,
      .metadata = request.metadata,
      .item_type = item_type,
      .expiry = request.expiry,
      .serial = request.serial,
      .location = request.location.empty() ? config.default_location
                                           : request.location,
      .category = request.category,
      .issued_at = context.height,
      .issuer = context.caller,
      .active = true};
  items_.insert_or_assign(id, std::move(item));
  serial_index_.insert_or_assign(request.serial, id);

  auto event = make_item_event(kItemMintedEvent, id);
  event.attributes.push_back(make_attribute("serial", request.serial, true));
  event.attributes.push_back(
      make_attribute("item_type", std::string{to_string(item_type)}, true));
  event.attributes.push_back(
      make_attribute("fee", std::to_string(fee), false));

  auto& ids = type_index_[item_type];
  if (ids.size() >= kTypeIndexCapacity) {
    const auto evicted = ids.front();
    ids.erase(std::begin(ids));
    spdlog::warn(
        "Type index for '{}' is full ({} ids); evicted item {} to index {}",
        to_string(item_type), kTypeIndexCapacity, evicted, id);
    event.attributes.push_back(
        make_attribute("evicted_id", std::to_string(evicted), false));
  }
  ids.push_back(id);

  spdlog::debug("Minted item {} (serial '{}') for '{}' at height {}", id,
                request.serial, context.caller, context.height);
  return result_t::success(id, {std::move(event)});
}

operation_result<bool> item_registry::update(const operation_context& context,
                                             const update_item_t& request) {
  using result_t = operation_result<bool>;
  auto it = items_.find(request.id);
  if (it == std::end(items_)) {
    return result_t::failure(registry_error_code::item_not_found);
  }
  auto& item = it->second;
  if (item.issuer != context.caller) {
    spdlog::debug("Update of item {} by '{}' rejected: issuer is '{}'",
                  request.id, context.caller, item.issuer);
    return result_t::failure(registry_error_code::unauthorized);
  }
  if (!item.active) {
    return result_t::failure(registry_error_code::update_not_allowed);
  }

  const auto checks = std::array{
      check_metadata(request.metadata),
      check_expiry(request.expiry, context.height),
      check_location(request.location, config_.config().default_location)};
  for (const auto& check : checks) {
    if (check) {
      return result_t::failure(*check);
    }
  }

  item.metadata = request.metadata;
  item.expiry = request.expiry;
  item.location = request.location;
  amendments_.record(request.id,
                     item_amendment_t{.metadata = request.metadata,
                                      .expiry = request.expiry,
                                      .location = request.location,
                                      .updated_at = context.height,
                                      .updater = context.caller});

  spdlog::debug("Updated item {} at height {}", request.id, context.height);
  return result_t::success(true,
                           {make_item_event(kItemUpdatedEvent, request.id)});
}

operation_result<bool> item_registry::deactivate(
    const operation_context& context,
    const deactivate_item_t& request) {
  using result_t = operation_result<bool>;
  auto it = items_.find(request.id);
  if (it == std::end(items_)) {
    return result_t::failure(registry_error_code::item_not_found);
  }
  if (it->second.issuer != context.caller) {
    return result_t::failure(registry_error_code::unauthorized);
  }

  it->second.active = false;
  spdlog::debug("Deactivated item {} at height {}", request.id,
                context.height);
  return result_t::success(
      true, {make_item_event(kItemDeactivatedEvent, request.id)});
}

std::optional<item_state_t> item_registry::find_item(const item_id_t id) const {
  auto it = items_.find(id);
  if (it == std::end(items_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<item_amendment_t> item_registry::find_amendment(
    const item_id_t id) const {
  return amendments_.find(id);
}

std::optional<std::vector<item_id_t>> item_registry::items_by_type(
    const std::string_view item_type) const {
  auto type = try_from_string<item_type_t>(item_type);
  if (!type) {
    return std::nullopt;
  }
  auto it = type_index_.find(*type);
  if (it == std::end(type_index_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<item_id_t> item_registry::find_item_by_serial(
    const std::string_view serial) const {
  auto it = serial_index_.find(serial);
  if (it == std::end(serial_index_)) {
    return std::nullopt;
  }
  return it->second;
}

bool item_registry::is_serial_registered(const std::string_view serial) const {
  return serial_index_.find(serial) != std::end(serial_index_);
}

uint64_t item_registry::item_count() const {
  return config_.config().next_item_id;
}

const item_registry::items_t& item_registry::items() const {
  return items_;
}

const item_registry::serial_index_t& item_registry::serial_index() const {
  return serial_index_;
}

const item_registry::type_index_t& item_registry::type_index() const {
  return type_index_;
}

void item_registry::restore(items_t items,
                            serial_index_t serials,
                            type_index_t types) {
  items_ = std::move(items);
  serial_index_ = std::move(serials);
  type_index_ = std::move(types);
}

}  // namespace registrar::registry
