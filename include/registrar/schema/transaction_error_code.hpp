#pragma once

#include <cstdint>

namespace registrar::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
};

}  // namespace registrar::schema
