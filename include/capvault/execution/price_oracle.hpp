#pragma once

#include <capvault/schema/primitives.hpp>
#include <optional>

namespace capvault::execution {

/// Source of the native asset's exchange rate in the reference currency.
///
/// The rate carries the oracle's own decimal scale (see
/// `ledger_config_t::oracle_decimals`). `std::nullopt` means no reading is
/// available; the ledger does not judge staleness or range.
class price_oracle {
 public:
  virtual ~price_oracle() = default;

  virtual std::optional<capvault::schema::amount_t> read_rate() = 0;
};

}  // namespace capvault::execution
