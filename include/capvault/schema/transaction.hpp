#pragma once
#include <capvault/schema/deposit_native.hpp>
#include <capvault/schema/deposit_token.hpp>
#include <capvault/schema/primitives.hpp>
#include <capvault/schema/withdraw_native.hpp>
#include <capvault/schema/withdraw_token.hpp>
#include <variant>

namespace capvault::schema {

using transaction_payload_t = std::variant<deposit_native_t,
                                           deposit_token_t,
                                           withdraw_native_t,
                                           withdraw_token_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t caller{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace capvault::schema
