#pragma once

#include <registrar/schema/item_type.hpp>
#include <registrar/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Schema key type: engine keys.
// Registry workflow: Defines canonical key prefixes and key codecs for the
// persisted registry state. Every state key starts with the raw bytes of
// kStatePrefix so the whole state can be replaced in one batch.
namespace registrar::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kConfigKeyPrefix{"SYS|STATE|CONFIG|"};
inline constexpr std::string_view kItemKeyPrefix{"SYS|STATE|ITEM|"};
inline constexpr std::string_view kSerialKeyPrefix{"SYS|STATE|SERIAL|"};
inline constexpr std::string_view kTypeIndexKeyPrefix{"SYS|STATE|TYPE|"};
inline constexpr std::string_view kAmendmentKeyPrefix{"SYS|STATE|AMENDMENT|"};

template <typename Encoder, typename T>
registrar::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  auto key = registrar::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

inline registrar::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return registrar::schema::make_bytes(prefix);
}

template <typename Encoder>
registrar::schema::bytes_t make_config_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kConfigKeyPrefix, std::string{"CURRENT"});
}

template <typename Encoder>
registrar::schema::bytes_t make_item_key(Encoder& encoder,
                                         const registrar::schema::item_id_t id) {
  return make_prefixed_key(encoder, kItemKeyPrefix, id);
}

template <typename Encoder>
registrar::schema::bytes_t make_serial_key(Encoder& encoder,
                                           const std::string& serial) {
  return make_prefixed_key(encoder, kSerialKeyPrefix, serial);
}

template <typename Encoder>
registrar::schema::bytes_t make_type_index_key(
    Encoder& encoder,
    const registrar::schema::item_type_t item_type) {
  return make_prefixed_key(encoder, kTypeIndexKeyPrefix, item_type);
}

template <typename Encoder>
registrar::schema::bytes_t make_amendment_key(
    Encoder& encoder,
    const registrar::schema::item_id_t id) {
  return make_prefixed_key(encoder, kAmendmentKeyPrefix, id);
}

}  // namespace registrar::schema::key
