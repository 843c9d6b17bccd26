#pragma once

#include <capvault/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: ledger keys.
// Custody workflow: canonical key prefixes for balances, aggregate totals,
// the event history and the token book. Keys are raw bytes so RocksDB's
// lexicographic order matches account and event-id order.
namespace capvault::schema::key {

inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kNativeTotalKey{"SYS|STATE|NATIVE_TOTAL"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
inline constexpr std::string_view kConfigKey{"SYS|CONFIG|LEDGER"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kTokenBalancePrefix{"TOKEN|BALANCE|"};

capvault::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                            const bytes_view_t& id);
capvault::schema::bytes_t make_prefix_key(std::string_view prefix);

capvault::schema::bytes_t make_balance_key(const account_id_t& account);
capvault::schema::bytes_t make_event_key(uint64_t event_id);
capvault::schema::bytes_t make_token_balance_key(const account_id_t& account);

/// Inverse of make_balance_key; std::nullopt for foreign or truncated keys.
std::optional<account_id_t> parse_balance_key(const bytes_view_t& key);

}  // namespace capvault::schema::key
