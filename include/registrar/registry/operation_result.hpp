#pragma once

#include <registrar/schema/registry_error_code.hpp>
#include <registrar/schema/transaction_event.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace registrar::registry {

/// Tagged outcome of a registry entry point.
///
/// Holds either the success value together with the events the operation
/// emitted, or the error code of the first rule that rejected it. A failed
/// operation never carries events and never leaves state behind.
template <typename T>
struct operation_result final {
  std::optional<T> value;
  std::optional<registrar::schema::registry_error_code> error;
  std::vector<registrar::schema::transaction_event_t> events;

  bool ok() const { return !error.has_value(); }

  static operation_result success(
      T result,
      std::vector<registrar::schema::transaction_event_t> emitted = {}) {
    auto outcome = operation_result{};
    outcome.value = std::move(result);
    outcome.events = std::move(emitted);
    return outcome;
  }

  static operation_result failure(
      const registrar::schema::registry_error_code code) {
    auto outcome = operation_result{};
    outcome.error = code;
    return outcome;
  }
};

}  // namespace registrar::registry
