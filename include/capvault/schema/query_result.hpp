#pragma once

#include <capvault/schema/primitives.hpp>
#include <capvault/schema/query_error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace capvault::schema {

inline constexpr std::string_view kQueryCodespace{"capvault.query"};

template <uint16_t Version>
struct query_result;

/// Answer to `ledger::query`. On success `value` holds the SCALE-encoded
/// answer for `path`; otherwise `code` is a `query_error_code` and `log`
/// says what was wrong with `request`.
template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string codespace{kQueryCodespace};
  std::string log;
  std::string path;
  bytes_t request;
  bytes_t value;

  bool ok() const { return code == 0; }
  bool failed_with(const query_error_code error) const {
    return code == static_cast<uint32_t>(error);
  }
};

using query_result_t = query_result<1>;

}  // namespace capvault::schema
