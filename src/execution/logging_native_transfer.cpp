#include <spdlog/spdlog.h>
#include <capvault/execution/logging_native_transfer.hpp>

namespace capvault::execution {

send_outcome logging_native_transfer::send(
    const capvault::schema::account_id_t& to,
    const capvault::schema::amount_t& amount) {
  spdlog::info("Native payout of {} to {}", amount.str(),
               capvault::schema::to_hex(
                   capvault::schema::bytes_view_t{to.data(), to.size()}));
  return send_outcome{.success = true};
}

}  // namespace capvault::execution
