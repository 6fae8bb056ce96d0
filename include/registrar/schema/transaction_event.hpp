#pragma once

#include <registrar/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Registry workflow: Event stream item emitted by a successful registry
// operation (item-minted, item-updated, item-deactivated).
namespace registrar::schema {

inline constexpr std::string_view kItemMintedEvent{"item-minted"};
inline constexpr std::string_view kItemUpdatedEvent{"item-updated"};
inline constexpr std::string_view kItemDeactivatedEvent{"item-deactivated"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace registrar::schema
