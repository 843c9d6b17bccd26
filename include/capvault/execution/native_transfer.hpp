#pragma once

#include <capvault/schema/primitives.hpp>

namespace capvault::execution {

struct send_outcome final {
  bool success{};
  /// Raw failure detail reported by the receiving side.
  capvault::schema::bytes_t payload;
};

/// Outbound native value transfer. Receivers may call back into the ledger
/// from inside `send`.
class native_transfer {
 public:
  virtual ~native_transfer() = default;

  virtual send_outcome send(const capvault::schema::account_id_t& to,
                            const capvault::schema::amount_t& amount) = 0;
};

}  // namespace capvault::execution
