#pragma once
#include <capvault/schema/primitives.hpp>

// Schema type: ledger config.
// Custody workflow: construction-time parameters, immutable once the ledger
// has been opened against a store.
namespace capvault::schema {

inline constexpr uint32_t kDefaultOracleDecimals = 8;
inline constexpr uint32_t kDefaultNativeDecimals = 18;

template <uint16_t Version>
struct ledger_config;

template <>
struct ledger_config<1> final {
  uint16_t version{1};
  /// Ceiling in whole reference-currency units.
  amount_t deposit_cap{};
  uint32_t oracle_decimals{kDefaultOracleDecimals};
  uint32_t native_decimals{kDefaultNativeDecimals};
  /// Custody account that receives pulled tokens.
  account_id_t ledger_account{};

  bool operator==(const ledger_config&) const = default;
};

using ledger_config_t = ledger_config<1>;

}  // namespace capvault::schema
