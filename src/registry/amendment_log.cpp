#include <registrar/registry/amendment_log.hpp>

#include <utility>

namespace registrar::registry {

void amendment_log::record(const registrar::schema::item_id_t id,
                           registrar::schema::item_amendment_t amendment) {
  entries_.insert_or_assign(id, std::move(amendment));
}

std::optional<registrar::schema::item_amendment_t> amendment_log::find(
    const registrar::schema::item_id_t id) const {
  auto it = entries_.find(id);
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t amendment_log::size() const {
  return entries_.size();
}

const amendment_log::entries_t& amendment_log::entries() const {
  return entries_;
}

void amendment_log::restore(entries_t entries) {
  entries_ = std::move(entries);
}

}  // namespace registrar::registry
