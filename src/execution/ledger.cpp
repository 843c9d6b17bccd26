#include <spdlog/spdlog.h>
#include <capvault/blake3/hash.hpp>
#include <capvault/execution/ledger.hpp>
#include <capvault/execution/ledger_error.hpp>
#include <capvault/execution/reentrancy_guard.hpp>
#include <capvault/schema/key/ledger_keys.hpp>
#include <capvault/schema/ledger_info.hpp>
#include <capvault/schema/query_error_code.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <tuple>
#include <utility>

using namespace capvault::schema;

namespace {

// 10^77 is the largest power of ten below 2^256.
constexpr uint32_t kMaxDecimals = 77;

transaction_result_t make_failure(const ledger_error_code code,
                                  std::string info) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kLedgerCodespace};
  return result;
}

transaction_event_t to_transaction_event(const ledger_event_t& event) {
  auto out = transaction_event_t{};
  out.type = std::string{to_string(event.type)};
  out.attributes = {
      event_attribute{.key = std::string{kEventIdAttribute},
                      .value = std::to_string(event.event_id)},
      event_attribute{.key = std::string{kAccountAttribute},
                      .value = to_hex(bytes_view_t{event.account.data(),
                                                   event.account.size()}),
                      .indexed = true},
      event_attribute{.key = std::string{kAssetAttribute},
                      .value = std::string{to_string(event.asset)},
                      .indexed = true},
      event_attribute{.key = std::string{kAmountAttribute},
                      .value = event.amount.str()}};
  return out;
}

transaction_result_t make_success(const std::vector<ledger_event_t>& events) {
  auto result = transaction_result_t{};
  result.codespace = std::string{kLedgerCodespace};
  result.events.reserve(events.size());
  std::transform(std::begin(events), std::end(events),
                 std::back_inserter(result.events), to_transaction_event);
  return result;
}

query_result_t make_query_result(const std::string_view path,
                                 const bytes_view_t& request) {
  auto result = query_result_t{};
  result.path = std::string{path};
  result.request = make_bytes(request);
  return result;
}

query_result_t make_query_failure(const query_error_code code,
                                  std::string log,
                                  const std::string_view path,
                                  const bytes_view_t& request) {
  auto result = make_query_result(path, request);
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  return result;
}

amount_t saturate(const wide_amount_t& value) {
  static const auto kMax = wide_amount_t{std::numeric_limits<amount_t>::max()};
  if (value > kMax) {
    return std::numeric_limits<amount_t>::max();
  }
  return static_cast<amount_t>(value);
}

std::string short_account(const account_id_t& account) {
  return to_hex(bytes_view_t{account.data(), 4});
}

}  // namespace

namespace capvault::execution {

/// Journal scope for one operation. Rolls its frame back unless committed.
class ledger::operation_scope final {
 public:
  explicit operation_scope(ledger& owner) : owner_{owner} {
    owner_.pending_.emplace();
  }

  operation_scope(const operation_scope&) = delete;
  operation_scope& operator=(const operation_scope&) = delete;

  ~operation_scope() {
    if (!committed_) {
      owner_.rollback_frame();
    }
  }

  std::vector<ledger_event_t> commit() {
    committed_ = true;
    return owner_.commit_frame();
  }

 private:
  ledger& owner_;
  bool committed_{false};
};

ledger::ledger(
    capvault::scale_encoder_t& encoder,
    capvault::storage::storage<capvault::storage::rocksdb_storage_tag>& storage,
    ledger_config_t config,
    std::shared_ptr<price_oracle> oracle,
    std::shared_ptr<token_transfer> token,
    std::shared_ptr<native_transfer> native_sender)
    : encoder_{encoder},
      storage_{storage},
      oracle_{std::move(oracle)},
      token_{std::move(token)},
      native_sender_{std::move(native_sender)} {
  if (!oracle_) {
    throw ledger_error{ledger_error_code::invalid_address,
                       "price oracle is not set"};
  }
  if (!token_) {
    throw ledger_error{ledger_error_code::invalid_address,
                       "token contract is not set"};
  }
  if (!native_sender_) {
    throw ledger_error{ledger_error_code::invalid_address,
                       "native transfer is not set"};
  }

  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(std::move(config));
  spdlog::info(
      "Ledger ready: {} account(s), native total {}, cap {} ({} decimals)",
      balances_.size(), native_total_.str(), config_.deposit_cap.str(),
      config_.oracle_decimals);
}

transaction_result_t ledger::deposit_native(const account_id_t& caller,
                                            const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (auto busy = refuse_if_busy(caller, "native deposit")) {
    return *busy;
  }
  if (amount == 0) {
    return make_failure(ledger_error_code::invalid_amount,
                        "deposit amount must be positive");
  }

  // Opened before the oracle read so a callback cannot move the total between
  // the cap check and the credit.
  auto scope = operation_scope{*this};
  auto projected =
      reference_value(wide_amount_t{native_total_} + wide_amount_t{amount});
  if (!projected) {
    return make_failure(ledger_error_code::oracle_unavailable,
                        "no native rate available");
  }
  if (*projected > wide_amount_t{scaled_deposit_cap_}) {
    spdlog::warn("Native deposit of {} by {} rejected: projected {} over cap {}",
                 amount.str(), short_account(caller), projected->str(),
                 scaled_deposit_cap_.str());
    return make_failure(ledger_error_code::cap_exceeded,
                        "projected value " + projected->str() +
                            " exceeds cap " + scaled_deposit_cap_.str());
  }

  auto balance = balance_of(caller);
  balance.native_amount += amount;
  set_balance(caller, balance);
  set_native_total(native_total_ + amount);
  record_event(ledger_event_type_t::deposit, caller, asset_kind_t::native,
               amount);
  return make_success(scope.commit());
}

transaction_result_t ledger::deposit_token(const account_id_t& caller,
                                           const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (auto busy = refuse_if_busy(caller, "token deposit")) {
    return *busy;
  }
  if (amount == 0) {
    return make_failure(ledger_error_code::invalid_amount,
                        "deposit amount must be positive");
  }

  auto scope = operation_scope{*this};
  if (!token_->pull(caller, config_.ledger_account, amount)) {
    spdlog::warn("Token deposit of {} by {} failed: pull refused",
                 amount.str(), short_account(caller));
    return make_failure(ledger_error_code::token_transfer_failed,
                        "token pull failed");
  }
  auto balance = balance_of(caller);
  balance.token_amount += amount;
  set_balance(caller, balance);
  record_event(ledger_event_type_t::deposit, caller, asset_kind_t::token,
               amount);
  return make_success(scope.commit());
}

transaction_result_t ledger::withdraw_native(const account_id_t& caller,
                                             const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{withdrawal_locked_};
  if (!guard.acquired()) {
    spdlog::warn("Native withdrawal by {} rejected: withdrawal in progress",
                 short_account(caller));
    return make_failure(ledger_error_code::reentrant_call,
                        "withdrawal already in progress");
  }
  if (auto busy = refuse_if_busy(caller, "native withdrawal")) {
    return *busy;
  }
  if (amount == 0) {
    return make_failure(ledger_error_code::invalid_amount,
                        "withdrawal amount must be positive");
  }
  auto balance = balance_of(caller);
  if (amount > balance.native_amount) {
    return make_failure(ledger_error_code::insufficient_balance,
                        "native balance " + balance.native_amount.str() +
                            " is below " + amount.str());
  }

  auto scope = operation_scope{*this};
  balance.native_amount -= amount;
  set_balance(caller, balance);
  set_native_total(native_total_ - amount);
  record_event(ledger_event_type_t::withdrawal, caller, asset_kind_t::native,
               amount);

  auto outcome = native_sender_->send(caller, amount);
  if (!outcome.success) {
    spdlog::warn("Native withdrawal of {} to {} failed: send refused",
                 amount.str(), short_account(caller));
    auto result = make_failure(ledger_error_code::transfer_failed,
                               "native send failed");
    result.data = std::move(outcome.payload);
    return result;
  }
  return make_success(scope.commit());
}

transaction_result_t ledger::withdraw_token(const account_id_t& caller,
                                            const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{withdrawal_locked_};
  if (!guard.acquired()) {
    spdlog::warn("Token withdrawal by {} rejected: withdrawal in progress",
                 short_account(caller));
    return make_failure(ledger_error_code::reentrant_call,
                        "withdrawal already in progress");
  }
  if (auto busy = refuse_if_busy(caller, "token withdrawal")) {
    return *busy;
  }
  if (amount == 0) {
    return make_failure(ledger_error_code::invalid_amount,
                        "withdrawal amount must be positive");
  }
  auto balance = balance_of(caller);
  if (amount > balance.token_amount) {
    return make_failure(ledger_error_code::insufficient_balance,
                        "token balance " + balance.token_amount.str() +
                            " is below " + amount.str());
  }

  auto scope = operation_scope{*this};
  balance.token_amount -= amount;
  set_balance(caller, balance);
  record_event(ledger_event_type_t::withdrawal, caller, asset_kind_t::token,
               amount);

  if (!token_->push(caller, amount)) {
    spdlog::warn("Token withdrawal of {} to {} failed: push refused",
                 amount.str(), short_account(caller));
    return make_failure(ledger_error_code::token_transfer_failed,
                        "token push failed");
  }
  return make_success(scope.commit());
}

transaction_result_t ledger::execute(const transaction_t& tx) {
  if (tx.version != 1) {
    return make_failure(ledger_error_code::unsupported_transaction_version,
                        "expected version 1");
  }
  return std::visit(
      overloaded{[&](const deposit_native_t& payload) {
                   return deposit_native(tx.caller, payload.amount);
                 },
                 [&](const deposit_token_t& payload) {
                   return deposit_token(tx.caller, payload.amount);
                 },
                 [&](const withdraw_native_t& payload) {
                   return withdraw_native(tx.caller, payload.amount);
                 },
                 [&](const withdraw_token_t& payload) {
                   return withdraw_token(tx.caller, payload.amount);
                 }},
      tx.payload);
}

transaction_result_t ledger::execute(const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return make_failure(ledger_error_code::invalid_transaction,
                        "empty transaction");
  }
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    return make_failure(ledger_error_code::invalid_transaction,
                        "transaction failed to decode");
  }
  return execute(*tx);
}

balance_state_t ledger::balances(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return balance_of(account);
}

std::optional<amount_t> ledger::convert_native_to_reference(
    const amount_t& amount) const {
  auto lock = std::scoped_lock{mutex_};
  auto value = reference_value(wide_amount_t{amount});
  if (!value) {
    return std::nullopt;
  }
  return saturate(*value);
}

amount_t ledger::native_total() const {
  auto lock = std::scoped_lock{mutex_};
  return native_total_;
}

amount_t ledger::scaled_deposit_cap() const {
  return scaled_deposit_cap_;
}

const ledger_config_t& ledger::config() const {
  return config_;
}

bool ledger::withdrawal_locked() const {
  auto lock = std::scoped_lock{mutex_};
  return withdrawal_locked_;
}

hash32_t ledger::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto hasher = capvault::blake3::hasher{};
  hasher.update(std::string_view{"capvault-state-v1"});
  auto prefix = key::make_prefix_key(key::kBalanceKeyPrefix);
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    hasher.update(bytes_view_t{row_key.data(), row_key.size()});
    hasher.update(bytes_view_t{row_value.data(), row_value.size()});
  }
  auto total = to_amount_bytes(native_total_);
  hasher.update(bytes_view_t{total.data(), total.size()});
  return hasher.finalize();
}

std::vector<ledger_event_t> ledger::history(const uint64_t from_id,
                                            const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto events = std::vector<ledger_event_t>{};
  if (from_id > to_id) {
    return events;
  }
  // Event keys are big-endian ids, so the id range is one key range.
  auto first = key::make_event_key(from_id);
  auto last = key::make_event_key(to_id);
  for (const auto& [row_key, row_value] :
       storage_.list_range(bytes_view_t{first.data(), first.size()},
                           bytes_view_t{last.data(), last.size()})) {
    auto event = encoder_.try_decode<ledger_event_t>(
        bytes_view_t{row_value.data(), row_value.size()});
    if (!event) {
      spdlog::warn("Skipping undecodable event row");
      continue;
    }
    events.push_back(std::move(*event));
  }
  return events;
}

query_result_t ledger::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = make_query_result(path, data);

  if (path == "/balances") {
    if (data.size() != account_id_t{}.size()) {
      return make_query_failure(query_error_code::invalid_key,
                                "account id must be 32 bytes", path, data);
    }
    auto account = account_id_t{};
    std::copy(std::begin(data), std::end(data), std::begin(account));
    result.value = encoder_.encode(balance_of(account));
    return result;
  }
  if (path == "/ledger/info") {
    auto info = ledger_info_t{};
    info.native_total = native_total_;
    info.scaled_deposit_cap = scaled_deposit_cap_;
    info.next_event_id = next_event_id_;
    info.state_root = state_root();
    result.value = encoder_.encode(info);
    return result;
  }
  if (path == "/convert") {
    auto amount = encoder_.try_decode<amount_bytes_t>(data);
    if (!amount) {
      return make_query_failure(query_error_code::invalid_key,
                                "amount must be 32 big-endian bytes", path,
                                data);
    }
    auto value = convert_native_to_reference(from_amount_bytes(*amount));
    if (!value) {
      return make_query_failure(query_error_code::oracle_unavailable,
                                "no native rate available", path, data);
    }
    result.value = encoder_.encode(to_amount_bytes(*value));
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_failure(query_error_code::invalid_key,
                                "expected (from_id, to_id)", path, data);
    }
    result.value = encoder_.encode(
        history(std::get<0>(range.value()), std::get<1>(range.value())));
    return result;
  }
  return make_query_failure(query_error_code::unsupported_path,
                            "unsupported query path", path, data);
}

void ledger::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

balance_state_t ledger::balance_of(const account_id_t& account) const {
  auto it = balances_.find(account);
  if (it == std::end(balances_)) {
    return balance_state_t{};
  }
  return it->second;
}

std::optional<transaction_result_t> ledger::refuse_if_busy(
    const account_id_t& caller,
    const std::string_view operation) const {
  if (!pending_) {
    return std::nullopt;
  }
  spdlog::warn("{} by {} rejected: another operation is in flight", operation,
               short_account(caller));
  return make_failure(ledger_error_code::reentrant_call,
                      "another ledger operation is in progress");
}

void ledger::set_balance(const account_id_t& account,
                         const balance_state_t& balance) {
  pending_->prior_balances.try_emplace(account, balance_of(account));
  if (balance.empty()) {
    balances_.erase(account);
  } else {
    balances_[account] = balance;
  }
}

void ledger::set_native_total(const amount_t& total) {
  auto& current = *pending_;
  if (!current.prior_native_total) {
    current.prior_native_total = native_total_;
  }
  native_total_ = total;
}

void ledger::record_event(const ledger_event_type_t type,
                          const account_id_t& account,
                          const asset_kind_t asset,
                          const amount_t& amount) {
  pending_->events.push_back(ledger_event_t{
      .type = type, .account = account, .asset = asset, .amount = amount});
}

std::vector<ledger_event_t> ledger::commit_frame() {
  auto committed = std::move(*pending_);
  pending_.reset();

  auto events = std::move(committed.events);
  persist(events, committed);
  if (event_sink_) {
    for (const auto& event : events) {
      event_sink_(event);
    }
  }
  return events;
}

void ledger::rollback_frame() {
  auto& current = *pending_;
  for (const auto& [account, prior] : current.prior_balances) {
    if (prior.empty()) {
      balances_.erase(account);
    } else {
      balances_[account] = prior;
    }
  }
  if (current.prior_native_total) {
    native_total_ = *current.prior_native_total;
  }
  if (!current.events.empty()) {
    spdlog::debug("Rolled back {} pending event(s)", current.events.size());
  }
  pending_.reset();
}

void ledger::persist(std::vector<ledger_event_t>& events,
                     const frame& committed) {
  auto writes = capvault::storage::write_set{};
  for (const auto& [account, prior] : committed.prior_balances) {
    auto balance_key = key::make_balance_key(account);
    auto balance = balance_of(account);
    if (balance.empty()) {
      writes.deletes.push_back(std::move(balance_key));
    } else {
      writes.puts.emplace_back(std::move(balance_key),
                               encoder_.encode(balance));
    }
  }
  if (committed.prior_native_total) {
    writes.puts.emplace_back(key::make_prefix_key(key::kNativeTotalKey),
                             encoder_.encode(to_amount_bytes(native_total_)));
  }
  if (!events.empty()) {
    for (auto& event : events) {
      event.event_id = next_event_id_++;
      writes.puts.emplace_back(key::make_event_key(event.event_id),
                               encoder_.encode(event));
    }
    writes.puts.emplace_back(key::make_prefix_key(key::kEventSeqKey),
                             encoder_.encode(next_event_id_));
  }
  storage_.commit(writes);
  spdlog::debug("Committed {} balance row(s) and {} event(s)",
                committed.prior_balances.size(), events.size());
}

std::optional<wide_amount_t> ledger::reference_value(
    const wide_amount_t& amount) const {
  auto rate = oracle_->read_rate();
  if (!rate) {
    spdlog::warn("Price oracle returned no rate");
    return std::nullopt;
  }
  return (amount * wide_amount_t{*rate}) / wide_amount_t{native_unit_};
}

void ledger::load_persisted_state(ledger_config_t config) {
  spdlog::debug("Loading persisted ledger state");
  auto config_key = key::make_prefix_key(key::kConfigKey);
  auto config_view = bytes_view_t{config_key.data(), config_key.size()};
  auto stored = storage_.get<capvault::scale_encoder_t, ledger_config_t>(
      encoder_, config_view);
  if (stored) {
    if (!(*stored == config)) {
      spdlog::warn("Ignoring supplied ledger config; store was opened with "
                   "cap {} and {} oracle decimals",
                   stored->deposit_cap.str(), stored->oracle_decimals);
    }
    config = *stored;
  }
  if (config.oracle_decimals > kMaxDecimals ||
      config.native_decimals > kMaxDecimals) {
    throw std::invalid_argument{"ledger decimals must not exceed 77"};
  }
  if (!stored) {
    storage_.put(encoder_, config_view, config);
  }
  config_ = config;
  native_unit_ = pow10(config_.native_decimals);
  scaled_deposit_cap_ = saturate(wide_amount_t{config_.deposit_cap} *
                                 wide_amount_t{pow10(config_.oracle_decimals)});

  auto total_key = key::make_prefix_key(key::kNativeTotalKey);
  if (auto total = storage_.get<capvault::scale_encoder_t, amount_bytes_t>(
          encoder_, bytes_view_t{total_key.data(), total_key.size()})) {
    native_total_ = from_amount_bytes(*total);
  }
  auto seq_key = key::make_prefix_key(key::kEventSeqKey);
  if (auto seq = storage_.get<capvault::scale_encoder_t, uint64_t>(
          encoder_, bytes_view_t{seq_key.data(), seq_key.size()})) {
    next_event_id_ = *seq;
  }

  balances_.clear();
  auto prefix = key::make_prefix_key(key::kBalanceKeyPrefix);
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto account =
        key::parse_balance_key(bytes_view_t{row_key.data(), row_key.size()});
    auto balance = encoder_.try_decode<balance_state_t>(
        bytes_view_t{row_value.data(), row_value.size()});
    if (!account || !balance) {
      capvault::common::critical("corrupt balance row in ledger store");
    }
    balances_.emplace(*account, *balance);
  }

  auto sum = amount_t{};
  for (const auto& [account, balance] : balances_) {
    sum += balance.native_amount;
  }
  if (sum != native_total_) {
    capvault::common::critical(
        "Stored native total {} disagrees with balance sum {}",
        native_total_.str(), sum.str());
  }
}

}  // namespace capvault::execution
