#pragma once

#include <cstdint>
#include <string_view>

namespace capvault::schema {

enum class ledger_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_amount = 10,
  insufficient_balance = 11,
  cap_exceeded = 12,
  transfer_failed = 13,
  reentrant_call = 14,
  invalid_address = 15,
  token_transfer_failed = 16,
  oracle_unavailable = 17,
};

inline constexpr uint32_t to_code(const ledger_error_code value) {
  return static_cast<uint32_t>(value);
}

inline constexpr std::string_view to_string(const ledger_error_code value) {
  switch (value) {
    case ledger_error_code::invalid_transaction:
      return "invalid transaction";
    case ledger_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case ledger_error_code::invalid_amount:
      return "invalid amount";
    case ledger_error_code::insufficient_balance:
      return "insufficient balance";
    case ledger_error_code::cap_exceeded:
      return "deposit cap exceeded";
    case ledger_error_code::transfer_failed:
      return "native transfer failed";
    case ledger_error_code::reentrant_call:
      return "reentrant call";
    case ledger_error_code::invalid_address:
      return "invalid address";
    case ledger_error_code::token_transfer_failed:
      return "token transfer failed";
    case ledger_error_code::oracle_unavailable:
      return "price oracle unavailable";
  }
  return "unknown";
}

}  // namespace capvault::schema
