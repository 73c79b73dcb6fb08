#include "engine/cli_config.h"
#include "core/errors.h"
#include "engine/exec_dto.h"
#include "utils/string_utils.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace tradegate {
namespace cli {

CliOptions parse_command_line_args(int argc, char* argv[]) {
    args::ArgumentParser parser("tradegate_exec",
                                "Execute one trade intent against Bybit, Hyperliquid or Solana/Jupiter "
                                "and print the result as a single JSON object.");

    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> venue(parser, "venue", "bybit | hyperliquid | solana", {"venue"});
    args::ValueFlag<std::string> symbol(parser, "symbol", "Pair (BTCUSDT, BTC/USDT) or token mint", {"symbol"});
    args::ValueFlag<std::string> side(parser, "side", "buy | sell (default: buy)", {"side"});
    args::ValueFlag<std::string> amount(parser, "amount", "Order size / swap input amount", {"amount"});
    args::ValueFlag<double> leverage(parser, "x", "Leverage to set before ordering (perps)", {"leverage"});
    args::ValueFlag<double> price(parser, "price", "Limit price (Hyperliquid; default: 5% through mid)", {"price"});
    args::Flag reduce_only(parser, "reduce-only", "Only reduce an existing position", {"reduce-only"});
    args::Flag close(parser, "close", "Close the position (Solana: sell the full balance)", {"close"});
    args::ValueFlag<int> slippage_bps(parser, "bps", "Swap slippage tolerance in basis points (1..500)",
                                      {"slippage-bps"});
    args::ValueFlag<long> time_limit_ms(parser, "ms", "Upper bound on on-chain confirmation wait",
                                        {"time-limit-ms"});
    args::ValueFlag<std::string> api_key(parser, "key", "Bybit API key", {"api-key"});
    args::ValueFlag<std::string> api_secret(parser, "secret", "Bybit API secret", {"api-secret"});
    args::ValueFlag<std::string> private_key(parser, "key", "Wallet private key (hex, base58 or JSON array)",
                                             {"private-key"});
    args::ValueFlag<std::string> wallet_address(parser, "address", "Hyperliquid account address",
                                                {"wallet-address"});
    args::ValueFlag<std::string> vault_address(parser, "address", "Hyperliquid vault / sub-account",
                                               {"vault-address"});
    args::ValueFlag<std::string> intent_json(parser, "file", "Read the intent from a JSON document",
                                             {"intent-json"});
    args::ValueFlag<std::string> config(parser, "file", "YAML configuration file", {"config"});
    args::Flag testnet(parser, "testnet", "Use testnet/devnet endpoints", {"testnet"});
    args::ValueFlag<std::string> log_level(parser, "level", "trace|debug|info|warn|error (default: info)",
                                           {"log-level"});

    CliOptions options;

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cerr << parser;
        std::cerr << "\nExamples:\n";
        std::cerr << "  " << argv[0] << " --venue bybit --symbol BTC/USDT --side buy --amount 0.001 --leverage 5\n";
        std::cerr << "  " << argv[0] << " --venue hyperliquid --symbol ETH --side sell --amount 0.1 --testnet\n";
        std::cerr << "  " << argv[0] << " --venue solana --symbol <mint> --close\n\n";
        std::exit(0);
    } catch (const args::ParseError& e) {
        throw InputError(e.what());
    } catch (const args::ValidationError& e) {
        throw InputError(e.what());
    }

    if (venue) options.venue = args::get(venue);
    if (symbol) options.symbol = args::get(symbol);
    if (side) options.side = args::get(side);
    if (amount) options.amount = args::get(amount);
    if (leverage) options.leverage = args::get(leverage);
    if (price) options.price = args::get(price);
    if (slippage_bps) options.slippage_bps = args::get(slippage_bps);
    if (time_limit_ms) options.time_limit_ms = args::get(time_limit_ms);
    options.reduce_only = reduce_only;
    options.close = close;
    options.testnet = testnet;
    if (api_key) options.credentials.api_key = args::get(api_key);
    if (api_secret) options.credentials.api_secret = args::get(api_secret);
    if (private_key) options.credentials.private_key = args::get(private_key);
    if (wallet_address) options.credentials.wallet_address = args::get(wallet_address);
    if (vault_address) options.credentials.vault_address = args::get(vault_address);
    if (intent_json) options.intent_json_file = args::get(intent_json);
    if (config) options.config_file = args::get(config);
    if (log_level) options.log_level = args::get(log_level);

    if (options.intent_json_file.empty() && options.venue.empty()) {
        throw InputError("--venue is required (or --intent-json)");
    }
    return options;
}

EngineConfig load_engine_config(const CliOptions& options) {
    const bool testnet = options.testnet || auth::parse_bool_env("TRADEGATE_TESTNET", false);
    EngineConfig cfg = EngineConfig::for_network(testnet);
    if (!options.config_file.empty()) {
        ConfigLoader::load_from_yaml(options.config_file, cfg);
    }
    ConfigLoader::apply_env_overrides(cfg);
    ConfigLoader::validate(cfg);
    return cfg;
}

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InputError("cannot open intent file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void overlay(std::string& target, const std::string& value) {
    if (!value.empty()) target = value;
}

} // namespace

TradeIntent build_intent(const CliOptions& options) {
    IntentRequest req;
    if (!options.intent_json_file.empty()) {
        req = parse_trade_intent_json(read_file(options.intent_json_file));
    } else {
        req.intent.id = generate_intent_id();
    }
    TradeIntent& intent = req.intent;

    if (!options.venue.empty()) {
        const auto venue = parse_venue(options.venue);
        if (!venue) throw InputError("unknown venue: " + options.venue);
        intent.venue = *venue;
    }
    overlay(intent.symbol, utils::trim_ascii(options.symbol));
    if (options.intent_json_file.empty() || options.side != "buy") {
        const auto side = parse_side(options.side);
        if (!side) throw InputError("unknown side: " + options.side);
        intent.side = *side;
    }
    overlay(intent.amount, utils::trim_ascii(options.amount));
    if (options.leverage) intent.leverage = options.leverage;
    if (options.price) intent.price = options.price;
    if (options.reduce_only) intent.reduce_only = true;
    if (options.close) intent.action = IntentAction::Close;
    if (options.slippage_bps) intent.constraints.max_slippage_bps = options.slippage_bps;
    if (options.time_limit_ms) {
        if (*options.time_limit_ms <= 0) throw InputError("--time-limit-ms must be positive");
        intent.constraints.time_limit = std::chrono::milliseconds(*options.time_limit_ms);
    }

    auth::CliCredentialInputs creds = req.credentials;
    overlay(creds.api_key, options.credentials.api_key);
    overlay(creds.api_secret, options.credentials.api_secret);
    overlay(creds.private_key, options.credentials.private_key);
    overlay(creds.wallet_address, options.credentials.wallet_address);
    overlay(creds.vault_address, options.credentials.vault_address);
    intent.credentials = auth::resolve_credentials(intent.venue, creds);

    return intent;
}

bool initialize_logging(const std::string& level) {
    // Create logs directory if it doesn't exist
    try {
        std::filesystem::create_directories("logs");
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to create logs directory: " << ex.what() << std::endl;
        return false;
    }

    try {
        // stdout carries the result document; console logging goes to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/tradegate.log", 1024*1024*5, 3);
        file_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [PID:%P] [TID:%t] [%^%l%$] [%s:%#] [%!] %v");
        const auto lvl = spdlog::level::from_str(utils::to_lower_ascii(level));
        if (lvl == spdlog::level::off && utils::to_lower_ascii(level) != "off") {
            std::cerr << "Unknown log level '" << level << "', using info" << std::endl;
            logger->set_level(spdlog::level::info);
        } else {
            logger->set_level(lvl);
        }

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace cli
} // namespace tradegate
