#include <boost/program_options.hpp>
#include <capvault/config/ledger_options.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace capvault::config {

namespace {

capvault::schema::amount_t parse_amount_option(const std::string& name,
                                               const std::string& text) {
  auto amount = capvault::schema::try_parse_amount(text);
  if (!amount) {
    throw std::invalid_argument{"--" + name + " is not an unsigned amount: " +
                                text};
  }
  return *amount;
}

capvault::schema::account_id_t parse_account_option(const std::string& name,
                                                    const std::string& text) {
  auto account = capvault::schema::try_make_hash32(text);
  if (!account) {
    throw std::invalid_argument{"--" + name +
                                " must be 32 bytes of hex: " + text};
  }
  return *account;
}

po::options_description make_settings_description() {
  auto description = po::options_description{"Ledger settings"};
  description.add_options()(
      "db-path", po::value<std::string>()->default_value(
                     std::string{kDefaultDbPath}),
      "RocksDB directory holding the ledger state")(
      "deposit-cap", po::value<std::string>()->default_value("0"),
      "Deposit ceiling in whole reference-currency units")(
      "oracle-rate", po::value<std::string>(),
      "Native rate in reference currency, scaled by oracle-decimals")(
      "oracle-decimals",
      po::value<uint32_t>()->default_value(
          capvault::schema::kDefaultOracleDecimals),
      "Decimal places of the oracle rate")(
      "native-decimals",
      po::value<uint32_t>()->default_value(
          capvault::schema::kDefaultNativeDecimals),
      "Decimal places of the native asset")(
      "ledger-account", po::value<std::string>(),
      "Custody account (hex) that receives pulled tokens")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>()->default_value(std::string{kDefaultLogFile}),
      "Log file path");
  return description;
}

}  // namespace

ledger_options parse_ledger_options(int argc, const char* const argv[]) {
  auto generic = po::options_description{"Capvault"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI file with ledger settings");

  auto arguments = po::options_description{"Command arguments"};
  arguments.add_options()("account,a", po::value<std::string>(),
                          "Account id (hex)")(
      "amount,n", po::value<std::string>(), "Amount in base units")(
      "from", po::value<uint64_t>()->default_value(1),
      "First event id for `events`")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "Last event id for `events`");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(), "Command");
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto settings = make_settings_description();
  auto command_line = po::options_description{};
  command_line.add(generic).add(settings).add(arguments).add(hidden);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(command_line)
                .positional(positional)
                .run(),
            vm);

  auto options = ledger_options{};
  if (vm.contains("help")) {
    auto visible = po::options_description{};
    visible.add(generic).add(settings).add(arguments);
    auto help = std::ostringstream{};
    help << "Usage: capvault <command> [options]\n"
         << "Commands: deposit-native, deposit-token, withdraw-native,\n"
         << "          withdraw-token, balances, convert, mint-token, events,\n"
         << "          info\n\n"
         << visible;
    options.show_help = true;
    options.help_text = help.str();
    return options;
  }

  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw std::invalid_argument{"cannot open config file " + path};
    }
    po::store(po::parse_config_file(file, settings), vm);
  }
  po::notify(vm);

  if (vm.contains("command")) {
    options.command = vm["command"].as<std::string>();
  }
  options.db_path = vm["db-path"].as<std::string>();
  options.ledger.deposit_cap =
      parse_amount_option("deposit-cap", vm["deposit-cap"].as<std::string>());
  options.ledger.oracle_decimals = vm["oracle-decimals"].as<uint32_t>();
  options.ledger.native_decimals = vm["native-decimals"].as<uint32_t>();
  if (vm.contains("ledger-account")) {
    options.ledger.ledger_account = parse_account_option(
        "ledger-account", vm["ledger-account"].as<std::string>());
  }
  if (vm.contains("oracle-rate")) {
    options.oracle_rate = parse_amount_option(
        "oracle-rate", vm["oracle-rate"].as<std::string>());
  }
  options.log_level = vm["log-level"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();

  if (vm.contains("account")) {
    options.account =
        parse_account_option("account", vm["account"].as<std::string>());
  }
  if (vm.contains("amount")) {
    options.amount =
        parse_amount_option("amount", vm["amount"].as<std::string>());
  }
  options.from_id = vm["from"].as<uint64_t>();
  options.to_id = vm["to"].as<uint64_t>();
  return options;
}

}  // namespace capvault::config
