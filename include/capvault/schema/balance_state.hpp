#pragma once
#include <capvault/schema/primitives.hpp>

// Schema type: balance state.
// Custody workflow: per-account custodied amounts of both asset kinds. A zero
// record is equivalent to an absent one.
namespace capvault::schema {

template <uint16_t Version>
struct balance_state;

template <>
struct balance_state<1> final {
  uint16_t version{1};
  amount_t native_amount{};
  amount_t token_amount{};

  bool empty() const { return native_amount == 0 && token_amount == 0; }
  bool operator==(const balance_state&) const = default;
};

using balance_state_t = balance_state<1>;

}  // namespace capvault::schema
