#include <capvault/schema/key/ledger_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>

namespace capvault::schema::key {

capvault::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                            const bytes_view_t& id) {
  auto key = capvault::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

capvault::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return capvault::schema::make_bytes(prefix);
}

capvault::schema::bytes_t make_balance_key(const account_id_t& account) {
  return make_prefixed_key(kBalanceKeyPrefix,
                           bytes_view_t{account.data(), account.size()});
}

capvault::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto big_endian = boost::endian::big_uint64_buf_t{event_id};
  return make_prefixed_key(
      kEventPrefix,
      bytes_view_t{reinterpret_cast<const uint8_t*>(big_endian.data()),
                   sizeof(big_endian)});
}

capvault::schema::bytes_t make_token_balance_key(const account_id_t& account) {
  return make_prefixed_key(kTokenBalancePrefix,
                           bytes_view_t{account.data(), account.size()});
}

std::optional<account_id_t> parse_balance_key(const bytes_view_t& key) {
  auto account = account_id_t{};
  if (key.size() != kBalanceKeyPrefix.size() + account.size()) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(kBalanceKeyPrefix), std::end(kBalanceKeyPrefix),
                  std::begin(key))) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + kBalanceKeyPrefix.size(), std::end(key),
            std::begin(account));
  return account;
}

}  // namespace capvault::schema::key
