#pragma once

#include <cstdint>

// Schema type: query error code.
// Custody workflow: read-path failure taxonomy with stable numeric codes.
namespace capvault::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 3,
  oracle_unavailable = 4,
};

}  // namespace capvault::schema
