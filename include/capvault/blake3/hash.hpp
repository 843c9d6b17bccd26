#pragma once
#include <blake3.h>
#include <capvault/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace capvault::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const capvault::schema::bytes_view_t& bytes);

  capvault::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

capvault::schema::hash32_t hash(const std::string_view& str);
capvault::schema::hash32_t hash(const capvault::schema::bytes_view_t& bytes);

}  // namespace capvault::blake3
