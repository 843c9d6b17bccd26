#pragma once
#include <capvault/schema/primitives.hpp>

namespace capvault::schema {

template <uint16_t Version>
struct withdraw_native;

template <>
struct withdraw_native<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using withdraw_native_t = withdraw_native<1>;

}  // namespace capvault::schema
