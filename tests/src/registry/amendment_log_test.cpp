#include <registrar/registry/amendment_log.hpp>
#include <gtest/gtest.h>

#include <utility>

TEST(amendment_log, keeps_only_most_recent_amendment) {
  auto log = registrar::registry::amendment_log{};
  EXPECT_FALSE(log.find(0).has_value());

  log.record(0, registrar::schema::item_amendment_t{.metadata = "first",
                                                    .expiry = 10,
                                                    .location = "A",
                                                    .updated_at = 1,
                                                    .updater = "issuer"});
  log.record(0, registrar::schema::item_amendment_t{.metadata = "second",
                                                    .expiry = 20,
                                                    .location = "B",
                                                    .updated_at = 2,
                                                    .updater = "issuer"});
  ASSERT_EQ(log.size(), 1u);
  auto entry = log.find(0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->metadata, "second");
  EXPECT_EQ(entry->expiry, 20u);
  EXPECT_EQ(entry->location, "B");
  EXPECT_EQ(entry->updated_at, 2u);
  EXPECT_FALSE(log.find(1).has_value());
}

TEST(amendment_log, restore_replaces_entries) {
  auto log = registrar::registry::amendment_log{};
  log.record(4, registrar::schema::item_amendment_t{.metadata = "stale"});

  auto entries = registrar::registry::amendment_log::entries_t{};
  entries.emplace(7, registrar::schema::item_amendment_t{.metadata = "kept"});
  log.restore(std::move(entries));

  EXPECT_FALSE(log.find(4).has_value());
  ASSERT_TRUE(log.find(7).has_value());
  EXPECT_EQ(log.find(7)->metadata, "kept");
}
