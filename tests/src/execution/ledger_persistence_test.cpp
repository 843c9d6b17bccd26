#include <capvault/execution/ledger.hpp>
#include <capvault/schema/ledger_info.hpp>
#include <capvault/schema/query_error_code.hpp>
#include <capvault/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <iterator>
#include <tuple>
#include <vector>

using capvault::schema::amount_t;
using capvault::schema::ledger_error_code;
using capvault::testing::ledger_fixture;
using capvault::testing::make_account;

TEST(ledger_persistence, balances_total_and_events_survive_reopen) {
  auto fixture = ledger_fixture{"capvault_persist_reopen"};
  auto alice = make_account(1);
  auto bob = make_account(2);
  ASSERT_TRUE(fixture.ledger().deposit_native(alice, 700).ok());
  ASSERT_TRUE(fixture.ledger().deposit_native(bob, 300).ok());
  ASSERT_TRUE(fixture.ledger().deposit_token(bob, 40).ok());
  ASSERT_TRUE(fixture.ledger().withdraw_native(alice, 700).ok());
  auto root = fixture.ledger().state_root();

  fixture.reopen();

  EXPECT_EQ(fixture.ledger().balances(alice).native_amount, amount_t{0});
  EXPECT_EQ(fixture.ledger().balances(bob).native_amount, amount_t{300});
  EXPECT_EQ(fixture.ledger().balances(bob).token_amount, amount_t{40});
  EXPECT_EQ(fixture.ledger().native_total(), amount_t{300});
  EXPECT_EQ(fixture.ledger().state_root(), root);

  auto history = fixture.ledger().history(1, UINT64_MAX);
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history[3].event_id, 4u);

  // The sequence continues where it stopped.
  auto events = std::vector<capvault::schema::ledger_event_t>{};
  fixture.ledger().set_event_sink(
      [&](const capvault::schema::ledger_event_t& event) {
        events.push_back(event);
      });
  ASSERT_TRUE(fixture.ledger().deposit_native(alice, 1).ok());
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event_id, 5u);
}

TEST(ledger_persistence, stored_config_wins_over_supplied_config) {
  auto fixture = ledger_fixture{"capvault_persist_config"};
  auto original = fixture.ledger().config();

  auto changed = original;
  changed.deposit_cap = 1;
  fixture.reopen(changed);

  EXPECT_EQ(fixture.ledger().config(), original);
  EXPECT_EQ(fixture.ledger().scaled_deposit_cap(),
            amount_t{1000000000000ULL});
}

TEST(ledger_persistence, state_root_depends_only_on_state) {
  auto first = ledger_fixture{"capvault_persist_root_a"};
  auto second = ledger_fixture{"capvault_persist_root_b"};
  EXPECT_EQ(first.ledger().state_root(), second.ledger().state_root());

  // Same end state reached through different histories.
  ASSERT_TRUE(first.ledger().deposit_native(make_account(1), 100).ok());
  ASSERT_TRUE(first.ledger().deposit_native(make_account(2), 50).ok());
  ASSERT_TRUE(second.ledger().deposit_native(make_account(2), 80).ok());
  ASSERT_TRUE(second.ledger().deposit_native(make_account(1), 100).ok());
  EXPECT_NE(first.ledger().state_root(), second.ledger().state_root());
  ASSERT_TRUE(second.ledger().withdraw_native(make_account(2), 30).ok());

  EXPECT_EQ(first.ledger().state_root(), second.ledger().state_root());
}

TEST(ledger_persistence, execute_dispatches_encoded_transactions) {
  auto fixture = ledger_fixture{"capvault_persist_execute"};
  auto alice = make_account(1);

  auto tx = capvault::schema::transaction_t{};
  tx.caller = alice;
  tx.payload = capvault::schema::deposit_native_t{.amount = 900};
  auto raw = fixture.encoder().encode(tx);
  auto result =
      fixture.ledger().execute(capvault::schema::make_bytes_view(raw));
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(fixture.ledger().balances(alice).native_amount, amount_t{900});

  tx.payload = capvault::schema::withdraw_native_t{.amount = 901};
  EXPECT_TRUE(fixture.ledger().execute(tx).failed_with(
      ledger_error_code::insufficient_balance));

  tx.version = 2;
  EXPECT_TRUE(fixture.ledger().execute(tx).failed_with(
      ledger_error_code::unsupported_transaction_version));

  auto garbage = capvault::schema::bytes_t{0x01};
  EXPECT_TRUE(fixture.ledger()
                  .execute(capvault::schema::make_bytes_view(garbage))
                  .failed_with(ledger_error_code::invalid_transaction));
  EXPECT_TRUE(fixture.ledger()
                  .execute(capvault::schema::bytes_view_t{})
                  .failed_with(ledger_error_code::invalid_transaction));
}

TEST(ledger_persistence, query_routes_answer_with_encoded_values) {
  auto fixture = ledger_fixture{"capvault_persist_query"};
  auto alice = make_account(1);
  ASSERT_TRUE(fixture.ledger().deposit_native(alice, 1000).ok());
  ASSERT_TRUE(fixture.ledger().deposit_token(alice, 5).ok());
  auto& encoder = fixture.encoder();

  auto balances = fixture.ledger().query(
      "/balances", capvault::schema::bytes_view_t{alice.data(), alice.size()});
  ASSERT_TRUE(balances.ok()) << balances.log;
  EXPECT_EQ(balances.path, "/balances");
  EXPECT_EQ(balances.request,
            (capvault::schema::bytes_t{std::begin(alice), std::end(alice)}));
  EXPECT_EQ(balances.codespace, "capvault.query");
  auto balance = encoder.decode<capvault::schema::balance_state_t>(
      capvault::schema::make_bytes_view(balances.value));
  EXPECT_EQ(balance.native_amount, amount_t{1000});
  EXPECT_EQ(balance.token_amount, amount_t{5});

  auto info = fixture.ledger().query("/ledger/info", {});
  ASSERT_EQ(info.code, 0u);
  auto decoded_info = encoder.decode<capvault::schema::ledger_info_t>(
      capvault::schema::make_bytes_view(info.value));
  EXPECT_EQ(decoded_info.native_total, amount_t{1000});
  EXPECT_EQ(decoded_info.next_event_id, 3u);
  EXPECT_EQ(decoded_info.state_root, fixture.ledger().state_root());

  auto amount_bytes = capvault::schema::to_amount_bytes(
      capvault::testing::amount("1000000000000000000"));
  auto convert = fixture.ledger().query(
      "/convert", capvault::schema::bytes_view_t{amount_bytes.data(),
                                                 amount_bytes.size()});
  ASSERT_EQ(convert.code, 0u);
  auto converted = encoder.decode<capvault::schema::amount_bytes_t>(
      capvault::schema::make_bytes_view(convert.value));
  EXPECT_EQ(capvault::schema::from_amount_bytes(converted),
            amount_t{393400000000ULL});

  auto range = encoder.encode(std::tuple{uint64_t{2}, uint64_t{2}});
  auto events = fixture.ledger().query(
      "/events/range", capvault::schema::make_bytes_view(range));
  ASSERT_EQ(events.code, 0u);
  auto decoded_events =
      encoder.decode<std::vector<capvault::schema::ledger_event_t>>(
          capvault::schema::make_bytes_view(events.value));
  ASSERT_EQ(decoded_events.size(), 1u);
  EXPECT_EQ(decoded_events[0].asset, capvault::schema::asset_kind_t::token);
}

TEST(ledger_persistence, query_rejects_bad_input) {
  auto fixture = ledger_fixture{"capvault_persist_query_errors"};
  auto short_key = capvault::schema::bytes_t{0x01, 0x02};

  auto bad_account = fixture.ledger().query(
      "/balances", capvault::schema::make_bytes_view(short_key));
  EXPECT_TRUE(bad_account.failed_with(
      capvault::schema::query_error_code::invalid_key));
  EXPECT_EQ(bad_account.codespace, "capvault.query");
  EXPECT_EQ(bad_account.path, "/balances");
  EXPECT_EQ(bad_account.request, short_key);
  EXPECT_TRUE(bad_account.value.empty());

  auto unknown = fixture.ledger().query("/nope", {});
  EXPECT_FALSE(unknown.ok());
  EXPECT_TRUE(unknown.failed_with(
      capvault::schema::query_error_code::unsupported_path));
  EXPECT_EQ(unknown.path, "/nope");

  fixture.oracle().rate.reset();
  auto amount_bytes = capvault::schema::to_amount_bytes(amount_t{1});
  auto convert = fixture.ledger().query(
      "/convert", capvault::schema::bytes_view_t{amount_bytes.data(),
                                                 amount_bytes.size()});
  EXPECT_TRUE(convert.failed_with(
      capvault::schema::query_error_code::oracle_unavailable));
}
