#pragma once

#include "core/auth/credentials_resolver.h"
#include "core/config/engine_config.h"
#include "engine/trade_intent.h"

#include <optional>
#include <string>

namespace tradegate {
namespace cli {

/**
 * @brief Raw command line options for tradegate_exec
 */
struct CliOptions {
    std::string venue;
    std::string symbol;
    std::string side{"buy"};
    std::string amount;
    std::optional<double> leverage;
    std::optional<double> price;
    std::optional<int> slippage_bps;
    std::optional<long> time_limit_ms;
    bool reduce_only{false};
    bool close{false};
    bool testnet{false};
    auth::CliCredentialInputs credentials;
    std::string intent_json_file;
    std::string config_file;
    std::string log_level{"info"};
};

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument vector
 * @return Parsed options
 * @throws InputError on unknown or malformed flags (--help prints usage and exits 0)
 */
CliOptions parse_command_line_args(int argc, char* argv[]);

/**
 * @brief Defaults for the selected network, then --config YAML, then TRADEGATE_* environment
 * @throws InputError when a source is unreadable or a value is out of range
 */
EngineConfig load_engine_config(const CliOptions& options);

/**
 * @brief Build the intent from --intent-json or from flags; CLI flags override the document
 * @throws InputError on missing fields or credentials
 */
TradeIntent build_intent(const CliOptions& options);

/**
 * @brief Initialize logging system (stderr + rotating logs/tradegate.log)
 * @param level spdlog level name
 * @return true if successful, false otherwise
 */
bool initialize_logging(const std::string& level);

} // namespace cli
} // namespace tradegate
