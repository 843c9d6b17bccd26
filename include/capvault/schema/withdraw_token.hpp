#pragma once
#include <capvault/schema/primitives.hpp>

namespace capvault::schema {

template <uint16_t Version>
struct withdraw_token;

template <>
struct withdraw_token<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using withdraw_token_t = withdraw_token<1>;

}  // namespace capvault::schema
