#pragma once

#include <capvault/execution/ledger.hpp>
#include <capvault/schema/encoding/scale/encoder.hpp>
#include <capvault/storage/rocksdb/storage.hpp>
#include <capvault/testing/common.hpp>
#include <capvault/testing/ledger_harness.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace capvault::testing {

/// Cap 10000 reference units, rate 3934.00000000 per native unit.
inline capvault::schema::ledger_config_t make_default_config() {
  auto config = capvault::schema::ledger_config_t{};
  config.deposit_cap = 10000;
  config.ledger_account = make_account(0xEE);
  return config;
}

inline capvault::schema::amount_t default_rate() {
  return capvault::schema::amount_t{393400000000ULL};
}

class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          capvault::schema::ledger_config_t config =
                              make_default_config())
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{capvault::storage::make_storage<
            capvault::storage::rocksdb_storage_tag>(db_path_)},
        config_{config},
        oracle_{std::make_shared<fake_price_oracle>()},
        token_{std::make_shared<fake_token_transfer>()},
        native_{std::make_shared<fake_native_transfer>()} {
    oracle_->rate = default_rate();
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    ledger_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  /// Drop the ledger and the database handle, then open both again.
  void reopen(std::optional<capvault::schema::ledger_config_t> config =
                  std::nullopt) {
    ledger_.reset();
    storage_.database.reset();
    storage_ = capvault::storage::make_storage<
        capvault::storage::rocksdb_storage_tag>(db_path_);
    if (config) {
      config_ = *config;
    }
    open();
  }

  capvault::scale_encoder_t& encoder() { return encoder_; }
  capvault::storage::storage<capvault::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }
  capvault::execution::ledger& ledger() { return *ledger_; }
  fake_price_oracle& oracle() { return *oracle_; }
  fake_token_transfer& token() { return *token_; }
  fake_native_transfer& native() { return *native_; }

 private:
  void open() {
    ledger_ = std::make_unique<capvault::execution::ledger>(
        encoder_, storage_, config_, oracle_, token_, native_);
  }

  std::string db_path_;
  capvault::scale_encoder_t encoder_;
  capvault::storage::storage<capvault::storage::rocksdb_storage_tag> storage_;
  capvault::schema::ledger_config_t config_;
  std::shared_ptr<fake_price_oracle> oracle_;
  std::shared_ptr<fake_token_transfer> token_;
  std::shared_ptr<fake_native_transfer> native_;
  std::unique_ptr<capvault::execution::ledger> ledger_;
};

}  // namespace capvault::testing
