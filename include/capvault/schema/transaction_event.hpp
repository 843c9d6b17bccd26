#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Custody workflow: `deposit` / `withdrawal` notification carried on the
// operation result. Attributes are named by the k*Attribute constants below.
namespace capvault::schema {

inline constexpr std::string_view kEventIdAttribute{"event_id"};
inline constexpr std::string_view kAccountAttribute{"account"};
inline constexpr std::string_view kAssetAttribute{"asset"};
inline constexpr std::string_view kAmountAttribute{"amount"};

/// One rendered field of an event. Account and asset are marked `indexed`
/// so an embedding host can filter notifications on them.
struct event_attribute final {
  std::string key;
  std::string value;
  bool indexed{};

  bool operator==(const event_attribute&) const = default;
};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute> attributes;

  std::optional<std::string_view> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return std::string_view{entry.value};
      }
    }
    return std::nullopt;
  }

  std::vector<std::string_view> indexed_keys() const {
    auto keys = std::vector<std::string_view>{};
    for (const auto& entry : attributes) {
      if (entry.indexed) {
        keys.emplace_back(entry.key);
      }
    }
    return keys;
  }

  bool operator==(const transaction_event&) const = default;
};

using transaction_event_t = transaction_event<1>;

}  // namespace capvault::schema
