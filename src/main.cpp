#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <capvault/common/critical.hpp>
#include <capvault/config/ledger_options.hpp>
#include <capvault/execution/ledger.hpp>
#include <capvault/execution/ledger_error.hpp>
#include <capvault/execution/logging_native_transfer.hpp>
#include <capvault/execution/static_price_oracle.hpp>
#include <capvault/execution/token_book.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace capvault::schema;

namespace {

void install_logger(const capvault::config::ledger_options& options) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "capvault", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

const account_id_t& require_account(
    const capvault::config::ledger_options& options) {
  if (!options.account) {
    throw std::invalid_argument{options.command + " requires --account"};
  }
  return *options.account;
}

const amount_t& require_amount(
    const capvault::config::ledger_options& options) {
  if (!options.amount) {
    throw std::invalid_argument{options.command + " requires --amount"};
  }
  return *options.amount;
}

int print_result(const transaction_result_t& result) {
  if (!result.ok()) {
    std::cout << "failed: " << result.log << " (" << result.codespace << "/"
              << result.code << ") " << result.info << std::endl;
    if (!result.data.empty()) {
      std::cout << "payload: "
                << to_hex(bytes_view_t{result.data.data(), result.data.size()})
                << std::endl;
    }
    return 1;
  }
  for (const auto& event : result.events) {
    std::cout << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return 0;
}

int run(const capvault::config::ledger_options& options) {
  auto encoder = capvault::scale_encoder_t{};
  auto storage = capvault::storage::make_storage<
      capvault::storage::rocksdb_storage_tag>(options.db_path);

  auto tokens = std::make_shared<capvault::execution::token_book>(
      encoder, storage, options.ledger.ledger_account);
  auto ledger = capvault::execution::ledger{
      encoder,
      storage,
      options.ledger,
      std::make_shared<capvault::execution::static_price_oracle>(
          options.oracle_rate),
      tokens,
      std::make_shared<capvault::execution::logging_native_transfer>()};
  // A reopened store keeps its own config, so pay out of the account the
  // ledger actually pulls into.
  tokens->set_custody_account(ledger.config().ledger_account);

  const auto& command = options.command;
  if (command == "deposit-native") {
    return print_result(ledger.deposit_native(require_account(options),
                                              require_amount(options)));
  }
  if (command == "deposit-token") {
    return print_result(ledger.deposit_token(require_account(options),
                                             require_amount(options)));
  }
  if (command == "withdraw-native") {
    return print_result(ledger.withdraw_native(require_account(options),
                                               require_amount(options)));
  }
  if (command == "withdraw-token") {
    return print_result(ledger.withdraw_token(require_account(options),
                                              require_amount(options)));
  }
  if (command == "mint-token") {
    tokens->mint(require_account(options), require_amount(options));
    return 0;
  }
  if (command == "balances") {
    const auto& account = require_account(options);
    auto balance = ledger.balances(account);
    std::cout << "native=" << balance.native_amount.str()
              << " token=" << balance.token_amount.str()
              << " wallet_token=" << tokens->balance_of(account).str()
              << std::endl;
    return 0;
  }
  if (command == "convert") {
    auto value = ledger.convert_native_to_reference(require_amount(options));
    if (!value) {
      std::cout << "failed: oracle_unavailable" << std::endl;
      return 1;
    }
    std::cout << value->str() << std::endl;
    return 0;
  }
  if (command == "events") {
    for (const auto& event : ledger.history(options.from_id, options.to_id)) {
      std::cout << event.event_id << " " << to_string(event.type) << " "
                << to_hex(bytes_view_t{event.account.data(),
                                       event.account.size()})
                << " " << to_string(event.asset) << " " << event.amount.str()
                << std::endl;
    }
    return 0;
  }
  if (command == "info") {
    auto root = ledger.state_root();
    std::cout << "native_total=" << ledger.native_total().str() << std::endl
              << "scaled_deposit_cap=" << ledger.scaled_deposit_cap().str()
              << std::endl
              << "state_root=" << to_hex(bytes_view_t{root.data(), root.size()})
              << std::endl;
    return 0;
  }
  throw std::invalid_argument{"unknown command '" + command + "'"};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = capvault::config::ledger_options{};
  try {
    options = capvault::config::parse_ledger_options(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  if (options.show_help || options.command.empty()) {
    std::cout << options.help_text;
    if (options.help_text.empty()) {
      std::cout << "Usage: capvault <command> [options] (see --help)"
                << std::endl;
    }
    return options.show_help ? 0 : 2;
  }

  install_logger(options);

  auto exit_code = 0;
  try {
    exit_code = run(options);
  } catch (const capvault::execution::ledger_error& e) {
    capvault::common::critical(e.what());
  } catch (const std::invalid_argument& e) {
    spdlog::error("{}", e.what());
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
