#pragma once

#include <capvault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace capvault::schema {

enum class asset_kind_t : uint8_t { native = 0, token = 1 };

inline constexpr auto kAssetKindMappings = std::array{
    std::pair<std::string_view, asset_kind_t>{"native", asset_kind_t::native},
    std::pair<std::string_view, asset_kind_t>{"token", asset_kind_t::token},
};

template <>
inline std::optional<asset_kind_t> try_from_string<asset_kind_t>(
    const std::string_view value) {
  return from_string(value, kAssetKindMappings);
}

inline constexpr std::string_view to_string(const asset_kind_t value) {
  return to_string(value, kAssetKindMappings).value_or("unknown");
}

}  // namespace capvault::schema
