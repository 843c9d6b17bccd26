#pragma once

#include <capvault/schema/asset_kind.hpp>
#include <capvault/schema/ledger_event_type.hpp>
#include <capvault/schema/primitives.hpp>

namespace capvault::schema {

template <uint16_t Version>
struct ledger_event;

/// Persisted history row for a committed deposit or withdrawal.
template <>
struct ledger_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  ledger_event_type_t type{};
  account_id_t account{};
  asset_kind_t asset{};
  amount_t amount{};

  bool operator==(const ledger_event&) const = default;
};

using ledger_event_t = ledger_event<1>;

}  // namespace capvault::schema
