#pragma once

#include <registrar/schema/primitives.hpp>

namespace registrar::registry {

/// Intrinsics the host attaches to every operation: the identity that
/// initiated it and the logical height it executes at.
struct operation_context final {
  registrar::schema::identity_t caller;
  registrar::schema::height_t height{};
};

}  // namespace registrar::registry
