#include <capvault/execution/ledger.hpp>
#include <capvault/execution/logging_native_transfer.hpp>
#include <capvault/execution/static_price_oracle.hpp>
#include <capvault/execution/token_book.hpp>
#include <capvault/schema/encoding/scale/encoder.hpp>
#include <capvault/storage/rocksdb/storage.hpp>
#include <capvault/testing/common.hpp>
#include <capvault/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <memory>

using capvault::schema::amount_t;
using capvault::testing::make_account;
using capvault::testing::make_db_path;
using capvault::testing::remove_path;

TEST(token_book, mint_pull_and_push_move_balances) {
  auto db = make_db_path("capvault_token_book");
  {
    auto encoder = capvault::scale_encoder_t{};
    auto storage = capvault::storage::make_storage<
        capvault::storage::rocksdb_storage_tag>(db);
    auto custody = make_account(0xEE);
    auto alice = make_account(1);
    auto book = capvault::execution::token_book{encoder, storage, custody};

    EXPECT_EQ(book.balance_of(alice), amount_t{0});
    book.mint(alice, 100);
    EXPECT_EQ(book.balance_of(alice), amount_t{100});

    EXPECT_FALSE(book.pull(alice, custody, 101));
    EXPECT_EQ(book.balance_of(alice), amount_t{100});

    EXPECT_TRUE(book.pull(alice, custody, 60));
    EXPECT_EQ(book.balance_of(alice), amount_t{40});
    EXPECT_EQ(book.balance_of(custody), amount_t{60});

    EXPECT_FALSE(book.push(alice, 61));
    EXPECT_TRUE(book.push(alice, 60));
    EXPECT_EQ(book.balance_of(alice), amount_t{100});
    EXPECT_EQ(book.balance_of(custody), amount_t{0});
  }
  remove_path(db);
}

TEST(token_book, backs_a_ledger_end_to_end) {
  auto db = make_db_path("capvault_token_book_ledger");
  {
    auto encoder = capvault::scale_encoder_t{};
    auto storage = capvault::storage::make_storage<
        capvault::storage::rocksdb_storage_tag>(db);
    auto config = capvault::testing::make_default_config();
    auto alice = make_account(1);
    auto book = std::make_shared<capvault::execution::token_book>(
        encoder, storage, config.ledger_account);
    auto ledger = capvault::execution::ledger{
        encoder,
        storage,
        config,
        std::make_shared<capvault::execution::static_price_oracle>(
            capvault::testing::default_rate()),
        book,
        std::make_shared<capvault::execution::logging_native_transfer>()};

    EXPECT_TRUE(ledger.deposit_token(alice, 10).failed_with(
        capvault::schema::ledger_error_code::token_transfer_failed));

    book->mint(alice, 10);
    ASSERT_TRUE(ledger.deposit_token(alice, 10).ok());
    EXPECT_EQ(book->balance_of(alice), amount_t{0});
    EXPECT_EQ(book->balance_of(config.ledger_account), amount_t{10});
    EXPECT_EQ(ledger.balances(alice).token_amount, amount_t{10});

    ASSERT_TRUE(ledger.withdraw_token(alice, 4).ok());
    EXPECT_EQ(book->balance_of(alice), amount_t{4});
    EXPECT_EQ(ledger.balances(alice).token_amount, amount_t{6});

    ASSERT_TRUE(ledger.deposit_native(alice, 1000).ok());
    ASSERT_TRUE(ledger.withdraw_native(alice, 1000).ok());
    EXPECT_EQ(ledger.native_total(), amount_t{0});
  }
  remove_path(db);
}

TEST(token_book, pays_out_of_stored_custody_after_reopen) {
  auto db = make_db_path("capvault_token_book_reopen");
  {
    auto encoder = capvault::scale_encoder_t{};
    auto storage = capvault::storage::make_storage<
        capvault::storage::rocksdb_storage_tag>(db);
    auto alice = make_account(1);
    auto stored_config = capvault::testing::make_default_config();
    auto make_ledger = [&](const capvault::schema::ledger_config_t& config,
                           std::shared_ptr<capvault::execution::token_book>
                               book) {
      return std::make_unique<capvault::execution::ledger>(
          encoder, storage, config,
          std::make_shared<capvault::execution::static_price_oracle>(
              capvault::testing::default_rate()),
          std::move(book),
          std::make_shared<capvault::execution::logging_native_transfer>());
    };

    {
      auto book = std::make_shared<capvault::execution::token_book>(
          encoder, storage, stored_config.ledger_account);
      auto ledger = make_ledger(stored_config, book);
      book->mint(alice, 50);
      ASSERT_TRUE(ledger->deposit_token(alice, 50).ok());
    }

    // Reopen with a different account on the command line; the store keeps
    // the original one.
    auto supplied = stored_config;
    supplied.ledger_account = make_account(0x42);
    auto book = std::make_shared<capvault::execution::token_book>(
        encoder, storage, supplied.ledger_account);
    auto ledger = make_ledger(supplied, book);
    ASSERT_EQ(ledger->config().ledger_account, stored_config.ledger_account);
    book->set_custody_account(ledger->config().ledger_account);
    EXPECT_EQ(book->custody_account(), stored_config.ledger_account);

    auto result = ledger->withdraw_token(alice, 20);
    ASSERT_TRUE(result.ok()) << result.log;
    EXPECT_EQ(book->balance_of(alice), amount_t{20});
    EXPECT_EQ(book->balance_of(stored_config.ledger_account), amount_t{30});
    EXPECT_EQ(book->balance_of(supplied.ledger_account), amount_t{0});
    EXPECT_EQ(ledger->balances(alice).token_amount, amount_t{30});
  }
  remove_path(db);
}

TEST(static_price_oracle, reports_configured_rate) {
  auto oracle = capvault::execution::static_price_oracle{amount_t{5}};
  EXPECT_EQ(oracle.read_rate(), amount_t{5});
  auto silent = capvault::execution::static_price_oracle{};
  EXPECT_FALSE(silent.read_rate().has_value());
}
