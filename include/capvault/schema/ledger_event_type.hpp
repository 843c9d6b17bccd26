#pragma once

#include <capvault/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace capvault::schema {

enum class ledger_event_type_t : uint8_t { deposit = 0, withdrawal = 1 };

inline constexpr auto kLedgerEventTypeMappings = std::array{
    std::pair<std::string_view, ledger_event_type_t>{
        "deposit", ledger_event_type_t::deposit},
    std::pair<std::string_view, ledger_event_type_t>{
        "withdrawal", ledger_event_type_t::withdrawal},
};

template <>
inline std::optional<ledger_event_type_t> try_from_string<ledger_event_type_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("unknown");
}

}  // namespace capvault::schema
