#pragma once

#include <capvault/schema/ledger_error_code.hpp>
#include <stdexcept>
#include <string>

namespace capvault::execution {

/// Raised when a ledger cannot be constructed.
class ledger_error final : public std::runtime_error {
 public:
  ledger_error(const capvault::schema::ledger_error_code code,
               const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  capvault::schema::ledger_error_code code() const noexcept { return code_; }

 private:
  capvault::schema::ledger_error_code code_;
};

}  // namespace capvault::execution
