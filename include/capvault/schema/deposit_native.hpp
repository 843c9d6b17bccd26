#pragma once
#include <capvault/schema/primitives.hpp>

namespace capvault::schema {

template <uint16_t Version>
struct deposit_native;

template <>
struct deposit_native<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using deposit_native_t = deposit_native<1>;

}  // namespace capvault::schema
