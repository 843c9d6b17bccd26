#pragma once

#include <capvault/execution/event_sink.hpp>
#include <capvault/execution/native_transfer.hpp>
#include <capvault/execution/price_oracle.hpp>
#include <capvault/execution/token_transfer.hpp>
#include <capvault/schema/balance_state.hpp>
#include <capvault/schema/encoding/scale/encoder.hpp>
#include <capvault/schema/ledger_config.hpp>
#include <capvault/schema/ledger_event.hpp>
#include <capvault/schema/primitives.hpp>
#include <capvault/schema/query_result.hpp>
#include <capvault/schema/transaction.hpp>
#include <capvault/schema/transaction_result.hpp>
#include <capvault/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace capvault::execution {

/// Custodial ledger for one native asset and one fungible token.
///
/// Tracks per-account balances, enforces a deposit ceiling priced through a
/// `price_oracle`, and moves value out through `native_transfer` and
/// `token_transfer`. Every mutating operation is atomic: it either commits all
/// of its balance changes and events in one storage batch, or leaves no trace.
///
/// One mutating operation runs at a time. A collaborator calling back into a
/// mutating operation while another is in flight gets `reentrant_call`; reads
/// are always allowed.
class ledger final {
 public:
  /// Open the ledger against `storage`, loading any committed balances.
  ///
  /// Throws `ledger_error` with `invalid_address` when a collaborator is
  /// missing. When the store already holds a config, that config wins and a
  /// differing `config` is reported with a warning.
  ledger(capvault::scale_encoder_t& encoder,
         capvault::storage::storage<capvault::storage::rocksdb_storage_tag>&
             storage,
         capvault::schema::ledger_config_t config,
         std::shared_ptr<price_oracle> oracle,
         std::shared_ptr<token_transfer> token,
         std::shared_ptr<native_transfer> native_sender);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  /// Credit `amount` of native value attached by `caller`.
  ///
  /// Rejected with `cap_exceeded` when the reference value of the new global
  /// native total would pass the cap. Landing exactly on the cap is allowed.
  capvault::schema::transaction_result_t deposit_native(
      const capvault::schema::account_id_t& caller,
      const capvault::schema::amount_t& amount);

  /// Pull `amount` of the token from `caller` into custody, then credit it.
  ///
  /// The credit is applied only once the pull has succeeded, so nothing is
  /// credited for tokens that never arrived.
  capvault::schema::transaction_result_t deposit_token(
      const capvault::schema::account_id_t& caller,
      const capvault::schema::amount_t& amount);

  /// Debit and send `amount` of native value to `caller`.
  ///
  /// Runs under the withdrawal lock. The debit is applied before the send and
  /// rolled back if the send fails; the receiver's failure payload is returned
  /// in `result.data`.
  capvault::schema::transaction_result_t withdraw_native(
      const capvault::schema::account_id_t& caller,
      const capvault::schema::amount_t& amount);

  /// Debit and push `amount` of the token to `caller` under the withdrawal
  /// lock.
  capvault::schema::transaction_result_t withdraw_token(
      const capvault::schema::account_id_t& caller,
      const capvault::schema::amount_t& amount);

  /// Dispatch a decoded transaction to the matching operation.
  capvault::schema::transaction_result_t execute(
      const capvault::schema::transaction_t& tx);

  /// Decode a SCALE transaction and dispatch it.
  capvault::schema::transaction_result_t execute(
      const capvault::schema::bytes_view_t& raw_tx);

  /// Balances of `account`; zero for accounts never seen.
  capvault::schema::balance_state_t balances(
      const capvault::schema::account_id_t& account) const;

  /// Reference-currency value of `amount` native units at the current oracle
  /// rate, truncated. std::nullopt when the oracle has no reading.
  std::optional<capvault::schema::amount_t> convert_native_to_reference(
      const capvault::schema::amount_t& amount) const;

  capvault::schema::amount_t native_total() const;
  /// Cap scaled to the oracle's decimals.
  capvault::schema::amount_t scaled_deposit_cap() const;
  const capvault::schema::ledger_config_t& config() const;

  /// True only while a withdrawal is in progress.
  bool withdrawal_locked() const;

  /// BLAKE3 digest of the committed balance rows and native total.
  capvault::schema::hash32_t state_root() const;

  /// Committed events with ids in the inclusive range.
  std::vector<capvault::schema::ledger_event_t> history(uint64_t from_id,
                                                        uint64_t to_id) const;

  /// Execute a read-path query by route.
  capvault::schema::query_result_t query(
      std::string_view path,
      const capvault::schema::bytes_view_t& data) const;

  /// Install a callback that receives every committed event.
  void set_event_sink(event_sink_t sink);

 private:
  class operation_scope;

  /// Prior values touched by the in-flight operation, kept for rollback.
  struct frame final {
    std::map<capvault::schema::account_id_t, capvault::schema::balance_state_t>
        prior_balances;
    std::optional<capvault::schema::amount_t> prior_native_total;
    std::vector<capvault::schema::ledger_event_t> events;
  };

  capvault::schema::balance_state_t balance_of(
      const capvault::schema::account_id_t& account) const;
  void set_balance(const capvault::schema::account_id_t& account,
                   const capvault::schema::balance_state_t& balance);
  void set_native_total(const capvault::schema::amount_t& total);
  void record_event(capvault::schema::ledger_event_type_t type,
                    const capvault::schema::account_id_t& account,
                    capvault::schema::asset_kind_t asset,
                    const capvault::schema::amount_t& amount);

  /// Fails with `reentrant_call` while another mutating operation is in
  /// flight.
  std::optional<capvault::schema::transaction_result_t> refuse_if_busy(
      const capvault::schema::account_id_t& caller,
      std::string_view operation) const;

  std::vector<capvault::schema::ledger_event_t> commit_frame();
  void rollback_frame();
  void persist(std::vector<capvault::schema::ledger_event_t>& events,
               const frame& committed);

  std::optional<capvault::schema::wide_amount_t> reference_value(
      const capvault::schema::wide_amount_t& amount) const;

  void load_persisted_state(capvault::schema::ledger_config_t config);

  // Collaborator callbacks may re-enter on the calling thread.
  mutable std::recursive_mutex mutex_;
  capvault::scale_encoder_t& encoder_;
  capvault::storage::storage<capvault::storage::rocksdb_storage_tag>& storage_;
  capvault::schema::ledger_config_t config_;
  capvault::schema::amount_t scaled_deposit_cap_{};
  capvault::schema::amount_t native_unit_{};
  std::shared_ptr<price_oracle> oracle_;
  std::shared_ptr<token_transfer> token_;
  std::shared_ptr<native_transfer> native_sender_;
  std::map<capvault::schema::account_id_t, capvault::schema::balance_state_t>
      balances_;
  capvault::schema::amount_t native_total_{};
  uint64_t next_event_id_{1};
  bool withdrawal_locked_{false};
  std::optional<frame> pending_;
  event_sink_t event_sink_;
};

}  // namespace capvault::execution
