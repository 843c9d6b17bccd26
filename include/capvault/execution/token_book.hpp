#pragma once

#include <capvault/execution/token_transfer.hpp>
#include <capvault/schema/encoding/scale/encoder.hpp>
#include <capvault/storage/rocksdb/storage.hpp>
#include <mutex>

namespace capvault::execution {

/// Token balances kept in the ledger's own store, for running the ledger
/// without an external token.
///
/// `push` pays out of `custody_account`; `pull` moves between any two
/// accounts. Both refuse rather than go negative.
class token_book final : public token_transfer {
 public:
  token_book(
      capvault::scale_encoder_t& encoder,
      capvault::storage::storage<capvault::storage::rocksdb_storage_tag>&
          storage,
      capvault::schema::account_id_t custody_account);

  bool pull(const capvault::schema::account_id_t& from,
            const capvault::schema::account_id_t& to,
            const capvault::schema::amount_t& amount) override;

  bool push(const capvault::schema::account_id_t& to,
            const capvault::schema::amount_t& amount) override;

  /// Pay out of `account` from now on. Set this to the account the ledger
  /// pulls into, which is the stored one when a store is reopened.
  void set_custody_account(const capvault::schema::account_id_t& account);

  capvault::schema::account_id_t custody_account() const;

  /// Create `amount` new tokens for `account`.
  void mint(const capvault::schema::account_id_t& account,
            const capvault::schema::amount_t& amount);

  capvault::schema::amount_t balance_of(
      const capvault::schema::account_id_t& account) const;

 private:
  bool move(const capvault::schema::account_id_t& from,
            const capvault::schema::account_id_t& to,
            const capvault::schema::amount_t& amount);

  mutable std::mutex mutex_;
  capvault::scale_encoder_t& encoder_;
  capvault::storage::storage<capvault::storage::rocksdb_storage_tag>& storage_;
  capvault::schema::account_id_t custody_account_;
};

}  // namespace capvault::execution
