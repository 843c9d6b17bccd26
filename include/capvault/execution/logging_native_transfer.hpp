#pragma once

#include <capvault/execution/native_transfer.hpp>

namespace capvault::execution {

/// Native sender for offline use: records the payout in the log and reports
/// success. Settlement happens outside the process.
class logging_native_transfer final : public native_transfer {
 public:
  send_outcome send(const capvault::schema::account_id_t& to,
                    const capvault::schema::amount_t& amount) override;
};

}  // namespace capvault::execution
