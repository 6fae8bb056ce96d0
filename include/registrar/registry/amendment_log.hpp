#pragma once

#include <registrar/schema/item_amendment.hpp>
#include <registrar/schema/primitives.hpp>

#include <cstddef>
#include <map>
#include <optional>

namespace registrar::registry {

/// Most recent amendment per item id. An entry exists only once an update
/// of that item succeeded; later updates overwrite it.
class amendment_log final {
 public:
  using entries_t =
      std::map<registrar::schema::item_id_t, registrar::schema::item_amendment_t>;

  void record(registrar::schema::item_id_t id,
              registrar::schema::item_amendment_t amendment);

  std::optional<registrar::schema::item_amendment_t> find(
      registrar::schema::item_id_t id) const;

  std::size_t size() const;
  const entries_t& entries() const;
  void restore(entries_t entries);

 private:
  entries_t entries_;
};

}  // namespace registrar::registry
