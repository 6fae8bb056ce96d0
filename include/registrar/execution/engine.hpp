#pragma once

#include <registrar/registry/amendment_log.hpp>
#include <registrar/registry/config_store.hpp>
#include <registrar/registry/item_registry.hpp>
#include <registrar/registry/value_transfer.hpp>
#include <registrar/schema/app_info.hpp>
#include <registrar/schema/block_result.hpp>
#include <registrar/schema/commit_result.hpp>
#include <registrar/schema/encoding/encoder.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/query_result.hpp>
#include <registrar/schema/transaction.hpp>
#include <registrar/schema/transaction_result.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace registrar::execution {

/// Deterministic registry state machine driven by the host chain.
///
/// The engine decodes transactions, applies them to the item registry in
/// block order, folds successful transactions into a rolling state root and
/// persists the registry state on commit. Queries read the in-memory state.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// Previously committed registry state is reloaded from `storage`.
  /// `transfer` collects the issuer fee on every mint; without one every
  /// mint fails with `fee_transfer_failed`.
  explicit engine(
      registrar::schema::encoding::encoder<
          registrar::schema::encoding::scale_encoder_tag>& encoder,
      registrar::storage::storage<registrar::storage::rocksdb_storage_tag>&
          storage,
      registrar::registry::value_transfer_t transfer = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Admit a transaction (decode + envelope checks only, no state change).
  registrar::schema::transaction_result_t check_transaction(
      const registrar::schema::bytes_view_t& raw_tx);

  /// Execute a block of transactions at `height`.
  ///
  /// Transactions are processed in order; per-tx results are returned even
  /// on failures, and a failed transaction leaves no state behind.
  registrar::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<registrar::schema::bytes_t>& txs);

  /// Persist the state produced by the last finalized block.
  registrar::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  registrar::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  ///
  /// Routes: /engine/info, /config, /item, /item/amendment, /items/by_type,
  /// /items/count, /serial/registered, /serial/item. Arguments and values are
  /// SCALE encoded.
  registrar::schema::query_result_t query(
      std::string_view path,
      const registrar::schema::bytes_view_t& data);

  /// Install the host value transfer capability.
  ///
  /// The transfer runs inside finalize_block with the engine lock held, so it
  /// must not call back into the engine.
  void set_value_transfer(registrar::registry::value_transfer_t transfer);

 private:
  /// Apply a decoded transaction at `height`.
  registrar::schema::transaction_result_t execute_operation(
      const registrar::schema::transaction_t& tx,
      uint64_t height);

  /// Serialize configuration, items, indexes and amendments to storage rows.
  std::vector<registrar::storage::key_value_entry_t> export_state();

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  registrar::schema::encoding::encoder<
      registrar::schema::encoding::scale_encoder_tag>& encoder_;
  registrar::storage::storage<registrar::storage::rocksdb_storage_tag>&
      storage_;
  registrar::registry::config_store config_;
  registrar::registry::amendment_log amendments_;
  registrar::registry::item_registry registry_;
  int64_t last_committed_height_{};
  registrar::schema::hash32_t last_committed_state_root_{};
  std::optional<int64_t> pending_height_;
  registrar::schema::hash32_t pending_state_root_{};
};

}  // namespace registrar::execution
