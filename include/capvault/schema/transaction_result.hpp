#pragma once

#include <capvault/schema/ledger_error_code.hpp>
#include <capvault/schema/primitives.hpp>
#include <capvault/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace capvault::schema {

inline constexpr std::string_view kLedgerCodespace{"capvault.ledger"};

template <uint16_t Version>
struct transaction_result;

/// Outcome of one ledger operation. `code == 0` means success; otherwise
/// `code` is a `ledger_error_code` and no state was changed.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  /// Raw failure payload from a collaborator (e.g. a failed native send).
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
  bool failed_with(const ledger_error_code error) const {
    return code == to_code(error);
  }
};

using transaction_result_t = transaction_result<1>;

}  // namespace capvault::schema
