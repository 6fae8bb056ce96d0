#include <registrar/registry/item_registry.hpp>
#include <registrar/schema/transaction_event.hpp>
#include <registrar/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using registrar::schema::registry_error_code;
using registrar::testing::kAuthority;
using registrar::testing::kIssuer;
using registrar::testing::kOtherIssuer;
using registrar::testing::registry_fixture;

std::optional<std::string> find_attribute(
    const registrar::schema::transaction_event_t& event,
    const std::string_view key) {
  auto it = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const auto& attribute) { return attribute.key == key; });
  if (it == std::end(event.attributes)) {
    return std::nullopt;
  }
  return it->value;
}

registrar::schema::update_item_t make_update(
    const registrar::schema::item_id_t id,
    std::string metadata,
    const registrar::schema::height_t expiry,
    std::string location) {
  return registrar::schema::update_item_t{.id = id,
                                          .metadata = std::move(metadata),
                                          .expiry = expiry,
                                          .location = std::move(location)};
}

}  // namespace

TEST(item_registry, mint_records_item_and_collects_fee) {
  auto fixture = registry_fixture{};
  ASSERT_TRUE(fixture.config().set_authority("AUTH").ok());

  auto result = fixture.registry().mint(
      registry_fixture::at(kIssuer, 0),
      registrar::schema::mint_item_t{.metadata = "Passport metadata",
                                     .item_type = "passport",
                                     .expiry = 100,
                                     .serial = "SERIAL123",
                                     .location = "BorderPost",
                                     .category = "TravelDoc"});
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result.value, 0u);

  auto item = fixture.registry().find_item(0);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->id, 0u);
  EXPECT_EQ(item->metadata, "Passport metadata");
  EXPECT_EQ(item->item_type, registrar::schema::item_type_t::passport);
  EXPECT_EQ(item->expiry, 100u);
  EXPECT_EQ(item->serial, "SERIAL123");
  EXPECT_EQ(item->location, "BorderPost");
  EXPECT_EQ(item->category, "TravelDoc");
  EXPECT_EQ(item->issued_at, 0u);
  EXPECT_EQ(item->issuer, kIssuer);
  EXPECT_TRUE(item->active);

  ASSERT_EQ(fixture.transfers.size(), 1u);
  EXPECT_EQ(fixture.transfers[0].amount, 500u);
  EXPECT_EQ(fixture.transfers[0].from, kIssuer);
  EXPECT_EQ(fixture.transfers[0].to, "AUTH");

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, registrar::schema::kItemMintedEvent);
  EXPECT_EQ(find_attribute(result.events[0], "id"), "0");
  EXPECT_EQ(find_attribute(result.events[0], "serial"), "SERIAL123");

  EXPECT_EQ(fixture.registry().item_count(), 1u);
  EXPECT_TRUE(fixture.registry().is_serial_registered("SERIAL123"));
  EXPECT_EQ(fixture.registry().find_item_by_serial("SERIAL123"), 0u);
}

TEST(item_registry, mint_without_authority_leaves_no_trace) {
  auto fixture = registry_fixture{};
  auto result = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                        registry_fixture::make_mint("S-1"));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::authority_not_set);
  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(fixture.transfers.empty());
  EXPECT_EQ(fixture.registry().item_count(), 0u);
  EXPECT_FALSE(fixture.registry().is_serial_registered("S-1"));
  EXPECT_FALSE(fixture.registry().find_item(0).has_value());
}

TEST(item_registry, oversized_metadata_rejected_before_other_checks) {
  auto fixture = registry_fixture{};
  auto request = registry_fixture::make_mint("S-1");
  request.metadata = std::string(101, 'm');
  request.item_type = "spaceship";
  request.serial = "";

  // No authority either: metadata still wins.
  auto result = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                        request);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::invalid_metadata);
  EXPECT_TRUE(fixture.transfers.empty());
  EXPECT_EQ(fixture.config().config().next_item_id, 0u);
}

TEST(item_registry, mint_checks_fields_in_order) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  const auto context = registry_fixture::at(kIssuer, 50);

  auto request = registry_fixture::make_mint("S-1");
  request.item_type = "spaceship";
  request.expiry = 10;
  EXPECT_EQ(*fixture.registry().mint(context, request).error,
            registry_error_code::invalid_item_type);

  request.item_type = "visa";
  EXPECT_EQ(*fixture.registry().mint(context, request).error,
            registry_error_code::expiry_past);

  request.expiry = 50;
  request.serial = std::string(51, 's');
  EXPECT_EQ(*fixture.registry().mint(context, request).error,
            registry_error_code::invalid_serial);

  request.serial = "S-1";
  request.location = std::string(51, 'l');
  EXPECT_EQ(*fixture.registry().mint(context, request).error,
            registry_error_code::invalid_location);

  request.location = "Geneva";
  request.category = "";
  EXPECT_EQ(*fixture.registry().mint(context, request).error,
            registry_error_code::invalid_category);

  request.category = "travel";
  EXPECT_TRUE(fixture.registry().mint(context, request).ok());
  EXPECT_EQ(fixture.transfers.size(), 1u);
}

TEST(item_registry, serial_can_only_be_minted_once) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("DUP"))
                  .ok());

  auto other = registry_fixture::make_mint("DUP");
  other.metadata = "Different metadata";
  other.item_type = "document";
  other.category = "other";
  auto result =
      fixture.registry().mint(registry_fixture::at(kOtherIssuer, 5), other);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::item_already_exists);

  EXPECT_EQ(fixture.registry().item_count(), 1u);
  EXPECT_EQ(fixture.transfers.size(), 1u);
  EXPECT_EQ(fixture.registry().find_item_by_serial("DUP"), 0u);
}

TEST(item_registry, ids_stay_dense_across_failed_mints) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  auto minted = 0u;
  for (auto i = 0; i < 10; ++i) {
    auto request = registry_fixture::make_mint("S-" + std::to_string(i / 2));
    auto result =
        fixture.registry().mint(registry_fixture::at(kIssuer, 0), request);
    if (result.ok()) {
      EXPECT_EQ(*result.value, minted);
      ++minted;
    } else {
      EXPECT_EQ(*result.error, registry_error_code::item_already_exists);
    }
  }
  ASSERT_EQ(minted, 5u);
  EXPECT_EQ(fixture.registry().item_count(), 5u);
  for (auto id = 0u; id < minted; ++id) {
    EXPECT_TRUE(fixture.registry().find_item(id).has_value()) << id;
  }
  EXPECT_FALSE(fixture.registry().find_item(minted).has_value());
}

TEST(item_registry, max_items_caps_minting) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.config().set_max_items(1).ok());

  auto first = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                       registry_fixture::make_mint("S-1"));
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(*first.value, 0u);

  auto second = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                        registry_fixture::make_mint("S-2"));
  ASSERT_FALSE(second.ok());
  EXPECT_EQ(*second.error, registry_error_code::max_items_exceeded);
  EXPECT_EQ(fixture.transfers.size(), 1u);
}

TEST(item_registry, refused_fee_transfer_aborts_mint) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  fixture.accept_transfers = false;

  auto result = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                        registry_fixture::make_mint("S-1"));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::fee_transfer_failed);
  EXPECT_EQ(fixture.registry().item_count(), 0u);
  EXPECT_FALSE(fixture.registry().is_serial_registered("S-1"));
  EXPECT_FALSE(fixture.registry().items_by_type("passport").has_value());

  fixture.accept_transfers = true;
  auto retry = fixture.registry().mint(registry_fixture::at(kIssuer, 0),
                                       registry_fixture::make_mint("S-1"));
  ASSERT_TRUE(retry.ok());
  EXPECT_EQ(*retry.value, 0u);
}

TEST(item_registry, missing_value_transfer_fails_mint) {
  auto config = registrar::registry::config_store{};
  auto amendments = registrar::registry::amendment_log{};
  auto registry = registrar::registry::item_registry{config, amendments};
  ASSERT_TRUE(config.set_authority(std::string{kAuthority}).ok());

  auto result = registry.mint(registry_fixture::at(kIssuer, 0),
                              registry_fixture::make_mint("S-1"));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::fee_transfer_failed);
  EXPECT_EQ(registry.item_count(), 0u);
}

TEST(item_registry, fee_follows_configuration) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.config().set_issuer_fee(42).ok());
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  ASSERT_EQ(fixture.transfers.size(), 1u);
  EXPECT_EQ(fixture.transfers[0].amount, 42u);
  EXPECT_EQ(fixture.transfers[0].to, kAuthority);
}

TEST(item_registry, location_matching_default_is_stored) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  auto request = registry_fixture::make_mint("S-1");
  request.location = "Global";
  ASSERT_TRUE(
      fixture.registry().mint(registry_fixture::at(kIssuer, 0), request).ok());
  EXPECT_EQ(fixture.registry().find_item(0)->location, "Global");

  request.serial = "S-2";
  request.location = "";
  EXPECT_EQ(
      *fixture.registry().mint(registry_fixture::at(kIssuer, 0), request).error,
      registry_error_code::invalid_location);
}

TEST(item_registry, type_index_groups_ids_by_kind) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  const auto kinds = std::array{"passport", "visa", "passport", "aid-kit"};
  for (std::size_t i = 0; i < kinds.size(); ++i) {
    auto request = registry_fixture::make_mint("S-" + std::to_string(i));
    request.item_type = kinds[i];
    ASSERT_TRUE(
        fixture.registry().mint(registry_fixture::at(kIssuer, 0), request).ok());
  }

  auto passports = fixture.registry().items_by_type("passport");
  ASSERT_TRUE(passports.has_value());
  EXPECT_EQ(*passports, (std::vector<registrar::schema::item_id_t>{0, 2}));
  EXPECT_EQ(*fixture.registry().items_by_type("visa"),
            (std::vector<registrar::schema::item_id_t>{1}));
  EXPECT_EQ(*fixture.registry().items_by_type("aid-kit"),
            (std::vector<registrar::schema::item_id_t>{3}));
  EXPECT_FALSE(fixture.registry().items_by_type("document").has_value());
  EXPECT_FALSE(fixture.registry().items_by_type("spaceship").has_value());
}

TEST(item_registry, full_type_index_evicts_oldest_id) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  const auto capacity = registrar::registry::kTypeIndexCapacity;
  for (std::size_t i = 0; i < capacity; ++i) {
    auto result = fixture.registry().mint(
        registry_fixture::at(kIssuer, 0),
        registry_fixture::make_mint("S-" + std::to_string(i)));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(find_attribute(result.events[0], "evicted_id").has_value());
  }

  auto overflow = fixture.registry().mint(
      registry_fixture::at(kIssuer, 0),
      registry_fixture::make_mint("S-" + std::to_string(capacity)));
  ASSERT_TRUE(overflow.ok());
  EXPECT_EQ(find_attribute(overflow.events[0], "evicted_id"), "0");

  auto ids = fixture.registry().items_by_type("passport");
  ASSERT_TRUE(ids.has_value());
  ASSERT_EQ(ids->size(), capacity);
  EXPECT_EQ(ids->front(), 1u);
  EXPECT_EQ(ids->back(), capacity);

  // The item itself and its serial survive eviction from the index.
  EXPECT_TRUE(fixture.registry().find_item(0).has_value());
  EXPECT_TRUE(fixture.registry().is_serial_registered("S-0"));
}

TEST(item_registry, update_replaces_fields_and_records_amendment) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  auto mint = registry_fixture::make_mint("S-1");
  mint.expiry = 300;
  ASSERT_TRUE(
      fixture.registry().mint(registry_fixture::at(kIssuer, 0), mint).ok());
  EXPECT_FALSE(fixture.registry().find_amendment(0).has_value());

  auto result = fixture.registry().update(registry_fixture::at(kIssuer, 301),
                                          make_update(0, "X", 400, "Loc"));
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, registrar::schema::kItemUpdatedEvent);
  EXPECT_EQ(find_attribute(result.events[0], "id"), "0");

  auto item = fixture.registry().find_item(0);
  EXPECT_EQ(item->metadata, "X");
  EXPECT_EQ(item->expiry, 400u);
  EXPECT_EQ(item->location, "Loc");
  EXPECT_EQ(item->serial, "S-1");
  EXPECT_EQ(item->category, "travel");
  EXPECT_EQ(item->issuer, kIssuer);

  auto amendment = fixture.registry().find_amendment(0);
  ASSERT_TRUE(amendment.has_value());
  EXPECT_EQ(amendment->metadata, "X");
  EXPECT_EQ(amendment->expiry, 400u);
  EXPECT_EQ(amendment->location, "Loc");
  EXPECT_EQ(amendment->updated_at, 301u);
  EXPECT_EQ(amendment->updater, kIssuer);
}

TEST(item_registry, update_expiry_measured_at_update_height) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  auto mint = registry_fixture::make_mint("S-1");
  mint.expiry = 300;
  ASSERT_TRUE(
      fixture.registry().mint(registry_fixture::at(kIssuer, 0), mint).ok());

  auto result = fixture.registry().update(registry_fixture::at(kIssuer, 301),
                                          make_update(0, "X", 300, "Loc"));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, registry_error_code::expiry_past);
  EXPECT_EQ(fixture.registry().find_item(0)->metadata, mint.metadata);
  EXPECT_FALSE(fixture.registry().find_amendment(0).has_value());
}

TEST(item_registry, second_update_overwrites_amendment) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  ASSERT_TRUE(fixture.registry()
                  .update(registry_fixture::at(kIssuer, 1),
                          make_update(0, "first", 10, "A"))
                  .ok());
  ASSERT_TRUE(fixture.registry()
                  .update(registry_fixture::at(kIssuer, 2),
                          make_update(0, "second", 20, "B"))
                  .ok());

  auto amendment = fixture.registry().find_amendment(0);
  ASSERT_TRUE(amendment.has_value());
  EXPECT_EQ(amendment->metadata, "second");
  EXPECT_EQ(amendment->expiry, 20u);
  EXPECT_EQ(amendment->location, "B");
  EXPECT_EQ(amendment->updated_at, 2u);
  EXPECT_EQ(fixture.amendments().size(), 1u);
}

TEST(item_registry, only_issuer_may_update_or_deactivate) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  ASSERT_TRUE(fixture.registry()
                  .update(registry_fixture::at(kIssuer, 1),
                          make_update(0, std::string{kOtherIssuer}, 10, "A"))
                  .ok());

  for (const auto caller : {kOtherIssuer, kAuthority}) {
    auto update = fixture.registry().update(registry_fixture::at(caller, 2),
                                            make_update(0, "hijack", 10, "B"));
    ASSERT_FALSE(update.ok());
    EXPECT_EQ(*update.error, registry_error_code::unauthorized);

    auto deactivate = fixture.registry().deactivate(
        registry_fixture::at(caller, 2),
        registrar::schema::deactivate_item_t{.id = 0});
    ASSERT_FALSE(deactivate.ok());
    EXPECT_EQ(*deactivate.error, registry_error_code::unauthorized);
  }
  EXPECT_TRUE(fixture.registry().find_item(0)->active);
  EXPECT_EQ(fixture.registry().find_amendment(0)->updater, kIssuer);
}

TEST(item_registry, unknown_id_is_reported_as_not_found) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  auto update = fixture.registry().update(registry_fixture::at(kIssuer, 0),
                                          make_update(7, "X", 10, "A"));
  EXPECT_EQ(*update.error, registry_error_code::item_not_found);
  auto deactivate = fixture.registry().deactivate(
      registry_fixture::at(kIssuer, 0),
      registrar::schema::deactivate_item_t{.id = 7});
  EXPECT_EQ(*deactivate.error, registry_error_code::item_not_found);
}

TEST(item_registry, deactivation_is_idempotent_and_final) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());

  for (auto i = 0; i < 2; ++i) {
    auto result = fixture.registry().deactivate(
        registry_fixture::at(kIssuer, 1),
        registrar::schema::deactivate_item_t{.id = 0});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.events.size(), 1u);
    EXPECT_EQ(result.events[0].type, registrar::schema::kItemDeactivatedEvent);
    EXPECT_FALSE(fixture.registry().find_item(0)->active);
  }

  auto update = fixture.registry().update(registry_fixture::at(kIssuer, 2),
                                          make_update(0, "X", 10, "A"));
  ASSERT_FALSE(update.ok());
  EXPECT_EQ(*update.error, registry_error_code::update_not_allowed);
  EXPECT_FALSE(fixture.registry().find_amendment(0).has_value());
  EXPECT_TRUE(fixture.registry().is_serial_registered("S-1"));
}

TEST(item_registry, update_checks_fields_in_order) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  auto update = [&](std::string metadata,
                    const registrar::schema::height_t expiry,
                    std::string location) {
    return fixture.registry().update(
        registry_fixture::at(kIssuer, 50),
        make_update(0, std::move(metadata), expiry, std::move(location)));
  };

  EXPECT_EQ(*update("", 1, "").error, registry_error_code::invalid_metadata);
  EXPECT_EQ(*update(std::string(101, 'm'), 1, "").error,
            registry_error_code::invalid_metadata);
  EXPECT_EQ(*update("X", 10, "").error, registry_error_code::expiry_past);
  EXPECT_EQ(*update("X", 50, "").error, registry_error_code::invalid_location);
  EXPECT_EQ(*update("X", 50, std::string(51, 'l')).error,
            registry_error_code::invalid_location);

  EXPECT_FALSE(fixture.registry().find_amendment(0).has_value());
  EXPECT_EQ(fixture.registry().find_item(0)->metadata, "Passport of J. Doe");

  EXPECT_TRUE(update("X", 50, "Lyon").ok());
  EXPECT_EQ(fixture.registry().find_item(0)->location, "Lyon");
}

TEST(item_registry, update_of_deactivated_item_checks_issuer_first) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  ASSERT_TRUE(fixture.registry()
                  .deactivate(registry_fixture::at(kIssuer, 1),
                              registrar::schema::deactivate_item_t{.id = 0})
                  .ok());

  // Invalid fields as well: authorization and activity are checked first.
  auto stranger = fixture.registry().update(
      registry_fixture::at(kOtherIssuer, 2), make_update(0, "", 0, ""));
  ASSERT_FALSE(stranger.ok());
  EXPECT_EQ(*stranger.error, registry_error_code::unauthorized);

  auto issuer = fixture.registry().update(registry_fixture::at(kIssuer, 2),
                                          make_update(0, "", 0, ""));
  ASSERT_FALSE(issuer.ok());
  EXPECT_EQ(*issuer.error, registry_error_code::update_not_allowed);
  EXPECT_FALSE(fixture.registry().find_amendment(0).has_value());
}

TEST(item_registry, configuration_changes_do_not_touch_minted_items) {
  auto fixture = registry_fixture{};
  fixture.bootstrap_authority();
  ASSERT_TRUE(fixture.registry()
                  .mint(registry_fixture::at(kIssuer, 0),
                        registry_fixture::make_mint("S-1"))
                  .ok());
  ASSERT_TRUE(fixture.config().set_default_location("Paris").ok());
  ASSERT_TRUE(fixture.config().set_issuer_fee(1).ok());

  auto item = fixture.registry().find_item(0);
  EXPECT_EQ(item->location, "Geneva");
  EXPECT_EQ(fixture.transfers[0].amount, 500u);
}
