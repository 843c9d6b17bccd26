#pragma once

#include <capvault/schema/primitives.hpp>

// Schema type: ledger info.
// Custody workflow: `/ledger/info` answer: aggregate custody figures plus the
// state root of the committed balances.
namespace capvault::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t version{1};
  amount_t native_total{};
  /// Cap scaled to the oracle's decimals.
  amount_t scaled_deposit_cap{};
  uint64_t next_event_id{};
  hash32_t state_root{};
};

using ledger_info_t = ledger_info<1>;

}  // namespace capvault::schema
