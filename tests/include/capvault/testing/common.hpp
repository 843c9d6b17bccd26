#pragma once

#include <capvault/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace capvault::testing {

inline capvault::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = capvault::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline capvault::schema::account_id_t make_account(const uint8_t seed) {
  return make_hash(seed);
}

/// Parse a decimal literal too wide for integer literals.
inline capvault::schema::amount_t amount(const std::string_view text) {
  return capvault::schema::amount_t{std::string{text}};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = uint64_t{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(++counter));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace capvault::testing
