#pragma once

#include <registrar/schema/primitives.hpp>
#include <functional>

namespace registrar::registry {

/// Host capability that moves `amount` units of value from one identity to
/// another. Returns false when the host refuses the transfer (for instance
/// on insufficient balance).
using value_transfer_t =
    std::function<bool(registrar::schema::amount_t amount,
                       const registrar::schema::identity_t& from,
                       const registrar::schema::identity_t& to)>;

}  // namespace registrar::registry
