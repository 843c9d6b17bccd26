#pragma once
#include <capvault/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace capvault::storage {

using key_value_entry_t =
    std::pair<capvault::schema::bytes_t, capvault::schema::bytes_t>;

/// Mutations applied together by `storage::commit`.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<capvault::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const capvault::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const capvault::schema::bytes_view_t& key,
           const T& value) const;

  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<capvault::schema::bytes_t> get_raw(
      const capvault::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const capvault::schema::bytes_view_t& prefix) const;

  /// Return the key-value pairs with `first <= key <= last`, in key order.
  std::vector<key_value_entry_t> list_range(
      const capvault::schema::bytes_view_t& first,
      const capvault::schema::bytes_view_t& last) const;

  /// Apply every put and delete of `writes` atomically.
  void commit(const write_set& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace capvault::storage
