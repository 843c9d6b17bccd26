#pragma once
#include <capvault/schema/primitives.hpp>

namespace capvault::schema {

template <uint16_t Version>
struct deposit_token;

template <>
struct deposit_token<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using deposit_token_t = deposit_token<1>;

}  // namespace capvault::schema
