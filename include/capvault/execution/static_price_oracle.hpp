#pragma once

#include <capvault/execution/price_oracle.hpp>

namespace capvault::execution {

/// Oracle that always reports the rate it was configured with. Constructed
/// without a rate it never has a reading.
class static_price_oracle final : public price_oracle {
 public:
  explicit static_price_oracle(
      std::optional<capvault::schema::amount_t> rate = std::nullopt)
      : rate_{std::move(rate)} {}

  std::optional<capvault::schema::amount_t> read_rate() override {
    return rate_;
  }

 private:
  std::optional<capvault::schema::amount_t> rate_;
};

}  // namespace capvault::execution
