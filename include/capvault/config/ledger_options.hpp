#pragma once

#include <capvault/schema/ledger_config.hpp>
#include <capvault/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Command line and config file settings for the capvault CLI.
namespace capvault::config {

inline constexpr std::string_view kDefaultDbPath{"capvault.db"};
inline constexpr std::string_view kDefaultLogFile{"capvault.log"};

struct ledger_options final {
  std::string command;
  std::string db_path{kDefaultDbPath};
  capvault::schema::ledger_config_t ledger{};
  /// Native rate scaled by `ledger.oracle_decimals`; unset means the oracle has
  /// no reading.
  std::optional<capvault::schema::amount_t> oracle_rate;
  std::string log_level{"info"};
  std::string log_file{kDefaultLogFile};

  std::optional<capvault::schema::account_id_t> account;
  std::optional<capvault::schema::amount_t> amount;
  uint64_t from_id{1};
  uint64_t to_id{UINT64_MAX};

  bool show_help{false};
  std::string help_text;
};

/// Parse `argv`, then the INI file named by `--config` if any. Values given on
/// the command line take precedence over the file.
///
/// Throws boost::program_options::error for malformed options and
/// std::invalid_argument for values that do not parse as amounts or
/// account ids.
ledger_options parse_ledger_options(int argc, const char* const argv[]);

}  // namespace capvault::config
