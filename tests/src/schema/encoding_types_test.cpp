#include <capvault/schema/encoding/scale/encoder.hpp>
#include <capvault/schema/key/ledger_keys.hpp>
#include <capvault/schema/ledger_event.hpp>
#include <capvault/schema/transaction.hpp>
#include <capvault/schema/transaction_event.hpp>
#include <capvault/testing/common.hpp>
#include <gtest/gtest.h>

#include <string_view>
#include <variant>

namespace {

using capvault::testing::make_account;

}  // namespace

TEST(encoding_types, balance_state_encodes_fixed_width_amounts) {
  auto encoder = capvault::scale_encoder_t{};
  auto balance = capvault::schema::balance_state_t{};
  balance.native_amount = 7;
  balance.token_amount = capvault::testing::amount(
      "340282366920938463463374607431768211456");  // 2^128

  auto encoded = encoder.encode(balance);
  // u16 version plus two 32-byte amounts.
  EXPECT_EQ(encoded.size(), 2u + 32u + 32u);
  EXPECT_EQ(encoded[2 + 31], 7u);

  auto decoded = encoder.decode<capvault::schema::balance_state_t>(
      capvault::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded, balance);
}

TEST(encoding_types, transaction_payload_keeps_variant_alternative) {
  auto encoder = capvault::scale_encoder_t{};
  auto tx = capvault::schema::transaction_t{};
  tx.caller = make_account(3);
  tx.payload = capvault::schema::withdraw_token_t{.amount = 42};

  auto encoded = encoder.encode(tx);
  auto decoded = encoder.try_decode<capvault::schema::transaction_t>(
      capvault::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1u);
  EXPECT_EQ(decoded->caller, tx.caller);
  ASSERT_TRUE(
      std::holds_alternative<capvault::schema::withdraw_token_t>(
          decoded->payload));
  EXPECT_EQ(std::get<capvault::schema::withdraw_token_t>(decoded->payload)
                .amount,
            capvault::schema::amount_t{42});
}

TEST(encoding_types, truncated_transaction_fails_to_decode) {
  auto encoder = capvault::scale_encoder_t{};
  auto tx = capvault::schema::transaction_t{};
  tx.payload = capvault::schema::deposit_native_t{.amount = 1};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() - 5);

  EXPECT_FALSE(encoder
                   .try_decode<capvault::schema::transaction_t>(
                       capvault::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, ledger_event_round_trips) {
  auto encoder = capvault::scale_encoder_t{};
  auto event = capvault::schema::ledger_event_t{
      .event_id = 9,
      .type = capvault::schema::ledger_event_type_t::withdrawal,
      .account = make_account(5),
      .asset = capvault::schema::asset_kind_t::token,
      .amount = 1000};

  auto decoded = encoder.try_decode<capvault::schema::ledger_event_t>(
      capvault::schema::make_bytes_view(encoder.encode(event)));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, event);
}

TEST(encoding_types, transaction_event_keeps_indexed_attributes) {
  auto encoder = capvault::scale_encoder_t{};
  auto event = capvault::schema::transaction_event_t{};
  event.type = "withdrawal";
  event.attributes = {
      capvault::schema::event_attribute{.key = "account",
                                        .value = "0a0b",
                                        .indexed = true},
      capvault::schema::event_attribute{.key = "amount", .value = "12"}};

  auto decoded = encoder.decode<capvault::schema::transaction_event_t>(
      capvault::schema::make_bytes_view(encoder.encode(event)));
  EXPECT_EQ(decoded, event);
  EXPECT_EQ(decoded.attribute("amount"), std::string_view{"12"});
  EXPECT_FALSE(decoded.attribute("asset").has_value());
  ASSERT_EQ(decoded.indexed_keys().size(), 1u);
  EXPECT_EQ(decoded.indexed_keys()[0], "account");
}

TEST(encoding_types, enum_names_match_event_vocabulary) {
  EXPECT_EQ(capvault::schema::to_string(
                capvault::schema::ledger_event_type_t::deposit),
            std::string_view{"deposit"});
  EXPECT_EQ(capvault::schema::to_string(capvault::schema::asset_kind_t::native),
            std::string_view{"native"});
  EXPECT_EQ(capvault::schema::to_string(
                capvault::schema::ledger_error_code::cap_exceeded),
            std::string_view{"deposit cap exceeded"});

  EXPECT_EQ(capvault::schema::try_from_string<capvault::schema::asset_kind_t>(
                "token"),
            capvault::schema::asset_kind_t::token);
  EXPECT_EQ(capvault::schema::try_from_string<
                capvault::schema::ledger_event_type_t>("withdrawal"),
            capvault::schema::ledger_event_type_t::withdrawal);
  EXPECT_FALSE(
      capvault::schema::try_from_string<capvault::schema::asset_kind_t>("gold")
          .has_value());
}

TEST(encoding_types, balance_keys_parse_back_to_accounts) {
  auto account = make_account(0x40);
  auto balance_key = capvault::schema::key::make_balance_key(account);
  EXPECT_TRUE(capvault::schema::make_string_view(balance_key)
                  .starts_with(capvault::schema::key::kBalanceKeyPrefix));

  auto parsed = capvault::schema::key::parse_balance_key(
      capvault::schema::make_bytes_view(balance_key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, account);

  auto foreign = capvault::schema::key::make_token_balance_key(account);
  EXPECT_FALSE(capvault::schema::key::parse_balance_key(
                   capvault::schema::make_bytes_view(foreign))
                   .has_value());
}

TEST(encoding_types, event_keys_sort_by_id) {
  auto low = capvault::schema::key::make_event_key(255);
  auto high = capvault::schema::key::make_event_key(256);
  EXPECT_LT(low, high);
}
