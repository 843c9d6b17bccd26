#include <spdlog/spdlog.h>
#include <capvault/execution/token_book.hpp>
#include <capvault/schema/key/ledger_keys.hpp>

using namespace capvault::schema;

namespace capvault::execution {

token_book::token_book(
    capvault::scale_encoder_t& encoder,
    capvault::storage::storage<capvault::storage::rocksdb_storage_tag>& storage,
    account_id_t custody_account)
    : encoder_{encoder},
      storage_{storage},
      custody_account_{custody_account} {}

bool token_book::pull(const account_id_t& from,
                      const account_id_t& to,
                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return move(from, to, amount);
}

bool token_book::push(const account_id_t& to, const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return move(custody_account_, to, amount);
}

void token_book::set_custody_account(const account_id_t& account) {
  auto lock = std::scoped_lock{mutex_};
  custody_account_ = account;
}

account_id_t token_book::custody_account() const {
  auto lock = std::scoped_lock{mutex_};
  return custody_account_;
}

void token_book::mint(const account_id_t& account, const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto balance_key = key::make_token_balance_key(account);
  auto balance = balance_of(account) + amount;
  storage_.put(encoder_,
               bytes_view_t{balance_key.data(), balance_key.size()},
               to_amount_bytes(balance));
  spdlog::info("Minted {} token(s); balance now {}", amount.str(),
               balance.str());
}

amount_t token_book::balance_of(const account_id_t& account) const {
  auto balance_key = key::make_token_balance_key(account);
  auto stored = storage_.get<capvault::scale_encoder_t, amount_bytes_t>(
      encoder_, bytes_view_t{balance_key.data(), balance_key.size()});
  if (!stored) {
    return amount_t{};
  }
  return from_amount_bytes(*stored);
}

bool token_book::move(const account_id_t& from,
                      const account_id_t& to,
                      const amount_t& amount) {
  auto from_balance = balance_of(from);
  if (amount > from_balance) {
    spdlog::debug("Token move of {} refused: source holds {}", amount.str(),
                  from_balance.str());
    return false;
  }
  if (from == to) {
    return true;
  }
  auto to_balance = balance_of(to);

  auto writes = capvault::storage::write_set{};
  writes.puts.emplace_back(key::make_token_balance_key(from),
                           encoder_.encode(to_amount_bytes(from_balance - amount)));
  writes.puts.emplace_back(key::make_token_balance_key(to),
                           encoder_.encode(to_amount_bytes(to_balance + amount)));
  storage_.commit(writes);
  return true;
}

}  // namespace capvault::execution
