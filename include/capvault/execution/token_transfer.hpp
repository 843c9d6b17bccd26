#pragma once

#include <capvault/schema/primitives.hpp>

namespace capvault::execution {

/// Transfer interface of the fungible token held in custody.
///
/// Both calls are all-or-nothing: `false` means no tokens moved.
class token_transfer {
 public:
  virtual ~token_transfer() = default;

  /// Move `amount` from `from` to `to` (used to pull deposits into custody).
  virtual bool pull(const capvault::schema::account_id_t& from,
                    const capvault::schema::account_id_t& to,
                    const capvault::schema::amount_t& amount) = 0;

  /// Move `amount` out of custody to `to`.
  virtual bool push(const capvault::schema::account_id_t& to,
                    const capvault::schema::amount_t& amount) = 0;
};

}  // namespace capvault::execution
