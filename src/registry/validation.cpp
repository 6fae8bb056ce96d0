#include <registrar/registry/validation.hpp>
#include <registrar/schema/item_type.hpp>

using registrar::schema::registry_error_code;

namespace registrar::registry {

namespace {

bool length_within(const std::string_view value, const std::size_t max) {
  return !value.empty() && value.size() <= max;
}

}  // namespace

check_result_t check_metadata(const std::string_view metadata) {
  if (!length_within(metadata, kMaxMetadataLength)) {
    return registry_error_code::invalid_metadata;
  }
  return std::nullopt;
}

check_result_t check_item_type(const std::string_view item_type) {
  if (!registrar::schema::try_from_string<registrar::schema::item_type_t>(
          item_type)) {
    return registry_error_code::invalid_item_type;
  }
  return std::nullopt;
}

check_result_t check_expiry(const registrar::schema::height_t expiry,
                            const registrar::schema::height_t current_height) {
  if (expiry < current_height) {
    return registry_error_code::expiry_past;
  }
  return std::nullopt;
}

check_result_t check_serial(const std::string_view serial) {
  if (!length_within(serial, kMaxSerialLength)) {
    return registry_error_code::invalid_serial;
  }
  return std::nullopt;
}

check_result_t check_location(const std::string_view location,
                              const std::string_view default_location) {
  if (location == default_location) {
    return std::nullopt;
  }
  if (!length_within(location, kMaxLocationLength)) {
    return registry_error_code::invalid_location;
  }
  return std::nullopt;
}

check_result_t check_category(const std::string_view category) {
  if (!length_within(category, kMaxCategoryLength)) {
    return registry_error_code::invalid_category;
  }
  return std::nullopt;
}

}  // namespace registrar::registry
