#pragma once
#include <registrar/schema/deactivate_item.hpp>
#include <registrar/schema/mint_item.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/set_authority.hpp>
#include <registrar/schema/set_default_location.hpp>
#include <registrar/schema/set_issuer_fee.hpp>
#include <registrar/schema/set_max_items.hpp>
#include <registrar/schema/update_item.hpp>
#include <variant>

namespace registrar::schema {

using transaction_payload_t = std::variant<set_authority_t,
                                           set_issuer_fee_t,
                                           set_max_items_t,
                                           set_default_location_t,
                                           mint_item_t,
                                           update_item_t,
                                           deactivate_item_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  identity_t caller;
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace registrar::schema
