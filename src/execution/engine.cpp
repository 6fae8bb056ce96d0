#include <spdlog/spdlog.h>
#include <registrar/blake3/hash.hpp>
#include <registrar/execution/engine.hpp>
#include <registrar/schema/key/engine_keys.hpp>
#include <registrar/schema/query_error_code.hpp>
#include <registrar/schema/registry_error_code.hpp>
#include <registrar/schema/transaction_error_code.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace registrar::schema;

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;

constexpr auto kQueryCodespace = std::string_view{"registrar.query"};

registrar::schema::hash32_t fold_state_root(
    const registrar::schema::hash32_t& seed,
    const registrar::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = registrar::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return registrar::blake3::hash(
      registrar::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<registrar::schema::transaction_t> decode_transaction(
    const registrar::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<registrar::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE payload";
  }
  return tx;
}

registrar::schema::transaction_result_t make_envelope_error(
    const transaction_error_code code,
    std::string log,
    std::string info,
    const std::string_view codespace) {
  auto result = registrar::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

/// Validate the envelope of a decoded transaction. Returns std::nullopt when
/// it may be executed.
std::optional<registrar::schema::transaction_result_t> check_envelope(
    const registrar::schema::transaction_t& tx,
    const std::string_view codespace) {
  if (tx.version != 1) {
    return make_envelope_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  return std::nullopt;
}

template <typename T>
registrar::schema::transaction_result_t to_transaction_result(
    registrar::registry::operation_result<T>&& outcome,
    const std::string_view codespace) {
  auto result = registrar::schema::transaction_result_t{};
  result.codespace = std::string{codespace};
  if (!outcome.ok()) {
    result.code = static_cast<uint32_t>(*outcome.error);
    result.log = std::string{to_string(*outcome.error)};
    return result;
  }
  auto encoder = encoder_t{};
  result.data = encoder.encode(*outcome.value);
  result.events = std::move(outcome.events);
  return result;
}

registrar::schema::bytes_view_t view(const registrar::schema::bytes_t& bytes) {
  return registrar::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

namespace registrar::execution {

engine::engine(encoder_t& encoder,
               registrar::storage::storage<
                   registrar::storage::rocksdb_storage_tag>& storage,
               registrar::registry::value_transfer_t transfer)
    : encoder_{encoder},
      storage_{storage},
      registry_{config_, amendments_, std::move(transfer)} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  pending_state_root_ = last_committed_state_root_;
  spdlog::info("Registry engine ready at height {} with {} item(s)",
               last_committed_height_, registry_.item_count());
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  constexpr auto kCodespace = std::string_view{"registrar.checktx"};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_envelope_error(transaction_error_code::invalid_transaction,
                               "invalid transaction", decode_error,
                               kCodespace);
  }
  if (auto rejected = check_envelope(*maybe_tx, kCodespace)) {
    return *rejected;
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               const uint64_t height) {
  auto context =
      registrar::registry::operation_context{.caller = tx.caller,
                                             .height = height};
  auto result = std::visit(
      overloaded{
          [&](const set_authority_t& op) {
            return to_transaction_result(config_.set_authority(op.authority),
                                         "registrar.config");
          },
          [&](const set_issuer_fee_t& op) {
            return to_transaction_result(config_.set_issuer_fee(op.fee),
                                         "registrar.config");
          },
          [&](const set_max_items_t& op) {
            return to_transaction_result(config_.set_max_items(op.max_items),
                                         "registrar.config");
          },
          [&](const set_default_location_t& op) {
            return to_transaction_result(
                config_.set_default_location(op.location), "registrar.config");
          },
          [&](const mint_item_t& op) {
            return to_transaction_result(registry_.mint(context, op),
                                         "registrar.mint");
          },
          [&](const update_item_t& op) {
            return to_transaction_result(registry_.update(context, op),
                                         "registrar.update");
          },
          [&](const deactivate_item_t& op) {
            return to_transaction_result(registry_.deactivate(context, op),
                                         "registrar.deactivate");
          }},
      tx.payload);

  if (result.code != 0) {
    spdlog::debug("Transaction from '{}' at height {} failed: {} ({})",
                  tx.caller, height, result.log, result.code);
  }
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  constexpr auto kCodespace = std::string_view{"registrar.finalize"};
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = pending_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(view(txs[i]), decode_error);
    if (!maybe_tx) {
      spdlog::warn("Skipping undecodable transaction {} at height {}: {}", i,
                   height, decode_error);
      result.tx_results.push_back(make_envelope_error(
          transaction_error_code::invalid_transaction, "invalid transaction",
          decode_error, kCodespace));
      continue;
    }
    if (auto rejected = check_envelope(*maybe_tx, kCodespace)) {
      result.tx_results.push_back(std::move(*rejected));
      continue;
    }
    auto tx_result = execute_operation(*maybe_tx, height);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_.has_value()) {
    last_committed_height_ = *pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_.reset();
  }

  auto prefix = key::make_prefix_key(key::kStatePrefix);
  storage_.replace_by_prefix(
      view(prefix), export_state(),
      registrar::storage::committed_state{
          .height = last_committed_height_,
          .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} with {} item(s)", last_committed_height_,
               registry_.item_count());

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto fail = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };
  auto decode_id = [&]() { return encoder_.try_decode<item_id_t>(data); };
  auto decode_text = [&]() { return encoder_.try_decode<std::string>(data); };

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_});
  } else if (path == "/config") {
    result.value = encoder_.encode(config_.config());
  } else if (path == "/items/count") {
    result.value = encoder_.encode(registry_.item_count());
  } else if (path == "/item") {
    auto id = decode_id();
    if (!id) {
      return fail(query_error_code::invalid_key, "expected item id");
    }
    auto item = registry_.find_item(*id);
    if (!item) {
      return fail(query_error_code::not_found, "item not found");
    }
    result.value = encoder_.encode(*item);
  } else if (path == "/item/amendment") {
    auto id = decode_id();
    if (!id) {
      return fail(query_error_code::invalid_key, "expected item id");
    }
    auto amendment = registry_.find_amendment(*id);
    if (!amendment) {
      return fail(query_error_code::not_found, "no amendment recorded");
    }
    result.value = encoder_.encode(*amendment);
  } else if (path == "/items/by_type") {
    auto item_type = decode_text();
    if (!item_type) {
      return fail(query_error_code::invalid_key, "expected item type");
    }
    auto ids = registry_.items_by_type(*item_type);
    if (!ids) {
      return fail(query_error_code::not_found, "no items of this type");
    }
    result.value = encoder_.encode(*ids);
  } else if (path == "/serial/registered") {
    auto serial = decode_text();
    if (!serial) {
      return fail(query_error_code::invalid_key, "expected serial");
    }
    result.value = encoder_.encode(registry_.is_serial_registered(*serial));
  } else if (path == "/serial/item") {
    auto serial = decode_text();
    if (!serial) {
      return fail(query_error_code::invalid_key, "expected serial");
    }
    auto id = registry_.find_item_by_serial(*serial);
    if (!id) {
      return fail(query_error_code::not_found, "serial not registered");
    }
    result.value = encoder_.encode(*id);
  } else {
    spdlog::warn("Rejecting query for unsupported path '{}'", path);
    return fail(query_error_code::unsupported_path, "unsupported path");
  }
  return result;
}

void engine::set_value_transfer(registrar::registry::value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  registry_.set_value_transfer(std::move(transfer));
}

std::vector<registrar::storage::key_value_entry_t> engine::export_state() {
  auto entries = std::vector<registrar::storage::key_value_entry_t>{};
  entries.emplace_back(key::make_config_key(encoder_),
                       encoder_.encode(config_.config()));
  for (const auto& [id, item] : registry_.items()) {
    entries.emplace_back(key::make_item_key(encoder_, id),
                         encoder_.encode(item));
  }
  for (const auto& [serial, id] : registry_.serial_index()) {
    entries.emplace_back(key::make_serial_key(encoder_, serial),
                         encoder_.encode(std::tuple{serial, id}));
  }
  for (const auto& [item_type, ids] : registry_.type_index()) {
    entries.emplace_back(key::make_type_index_key(encoder_, item_type),
                         encoder_.encode(std::tuple{item_type, ids}));
  }
  for (const auto& [id, amendment] : amendments_.entries()) {
    entries.emplace_back(key::make_amendment_key(encoder_, id),
                         encoder_.encode(std::tuple{id, amendment}));
  }
  return entries;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted registry state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }

  auto config_key = key::make_config_key(encoder_);
  if (auto config =
          storage_.get<registry_config_t>(encoder_, view(config_key))) {
    config_.restore(std::move(*config));
  }

  auto rows = [&](const std::string_view prefix) {
    auto prefix_key = key::make_prefix_key(prefix);
    return storage_.list_by_prefix(view(prefix_key));
  };

  auto items = registrar::registry::item_registry::items_t{};
  for (const auto& [row_key, value] : rows(key::kItemKeyPrefix)) {
    auto item = encoder_.decode<item_state_t>(view(value));
    auto id = item.id;
    items.insert_or_assign(id, std::move(item));
  }

  auto serials = registrar::registry::item_registry::serial_index_t{};
  for (const auto& [row_key, value] : rows(key::kSerialKeyPrefix)) {
    auto [serial, id] =
        encoder_.decode<std::tuple<std::string, item_id_t>>(view(value));
    serials.insert_or_assign(std::move(serial), id);
  }

  auto types = registrar::registry::item_registry::type_index_t{};
  for (const auto& [row_key, value] : rows(key::kTypeIndexKeyPrefix)) {
    auto [item_type, ids] =
        encoder_.decode<std::tuple<item_type_t, std::vector<item_id_t>>>(
            view(value));
    types.insert_or_assign(item_type, std::move(ids));
  }

  auto amendments = registrar::registry::amendment_log::entries_t{};
  for (const auto& [row_key, value] : rows(key::kAmendmentKeyPrefix)) {
    auto [id, amendment] =
        encoder_.decode<std::tuple<item_id_t, item_amendment_t>>(view(value));
    amendments.insert_or_assign(id, std::move(amendment));
  }

  if (items.size() != config_.config().next_item_id) {
    spdlog::warn("Persisted state holds {} item(s) but next item id is {}",
                 items.size(), config_.config().next_item_id);
  }
  registry_.restore(std::move(items), std::move(serials), std::move(types));
  amendments_.restore(std::move(amendments));
}

}  // namespace registrar::execution
