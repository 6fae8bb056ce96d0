#pragma once
#include <registrar/common/critical.hpp>
#include <registrar/schema/encoding/encoder.hpp>
#include <registrar/schema/encoding/scale/deactivate_item.hpp>
#include <registrar/schema/encoding/scale/item_amendment.hpp>
#include <registrar/schema/encoding/scale/item_state.hpp>
#include <registrar/schema/encoding/scale/item_type.hpp>
#include <registrar/schema/encoding/scale/mint_item.hpp>
#include <registrar/schema/encoding/scale/registry_config.hpp>
#include <registrar/schema/encoding/scale/set_authority.hpp>
#include <registrar/schema/encoding/scale/set_default_location.hpp>
#include <registrar/schema/encoding/scale/set_issuer_fee.hpp>
#include <registrar/schema/encoding/scale/set_max_items.hpp>
#include <registrar/schema/encoding/scale/transaction.hpp>
#include <registrar/schema/encoding/scale/transaction_event.hpp>
#include <registrar/schema/encoding/scale/transaction_event_attribute.hpp>
#include <registrar/schema/encoding/scale/transaction_result.hpp>
#include <registrar/schema/encoding/scale/update_item.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace registrar::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  registrar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, registrar::schema::bytes_t& out);

  template <typename T>
  T decode(const registrar::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const registrar::schema::bytes_view_t& bytes);
};

template <typename T>
registrar::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    registrar::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        registrar::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

/// Decode trusted bytes (our own storage). Malformed input is fatal.
template <typename T>
T encoder<scale_encoder_tag>::decode(
    const registrar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    registrar::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

/// Decode untrusted bytes (transactions, query arguments).
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const registrar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace registrar::schema::encoding
