/**
 * @file main.cpp
 * @brief Entry point of tradegate_exec: one intent in, one JSON result out.
 *
 * - Parses flags (or an intent document) and layered configuration
 * - Builds the venue adapters around one shared HTTP client
 * - Executes the intent through the coordinator, which appends the ledger
 * - Prints exactly one JSON object to stdout; logs go to stderr and logs/
 *
 * Exit codes: 0 success, 1 execution failure, 2 configuration error.
 */

#include "adapters/bybit/bybit_adapter.h"
#include "adapters/hyperliquid/hyperliquid_adapter.h"
#include "adapters/solana/solana_jupiter_adapter.h"
#include "core/errors.h"
#include "core/net/http_client.h"
#include "engine/cli_config.h"
#include "engine/execution_coordinator.h"
#include "engine/order_serializer.h"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfigError = 2;

void print_config_error(const std::string& message) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("success"); writer.Bool(false);
    writer.Key("status"); writer.String("rejected");
    writer.Key("error"); writer.String(message.c_str());
    writer.Key("reasonCode"); writer.String("invalid_params");
    writer.EndObject();
    std::cout << buffer.GetString() << std::endl;
}

tradegate::VenueRouter make_router(const tradegate::EngineConfig& cfg) {
    using namespace tradegate;
    nethttp::HttpOptions http_options;
    http_options.connect_timeout_ms = cfg.http.connect_timeout_ms;
    http_options.total_timeout_ms = cfg.http.total_timeout_ms;
    auto http = std::make_shared<const nethttp::HttpClient>(http_options);

    VenueRouter router;
    router.register_adapter(std::make_unique<BybitAdapter>(http, cfg.bybit));
    router.register_adapter(std::make_unique<HyperliquidAdapter>(http, cfg.hyperliquid, !cfg.testnet));
    router.register_adapter(std::make_unique<SolanaJupiterAdapter>(http, cfg.solana));
    return router;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace tradegate;

    cli::CliOptions options;
    try {
        options = cli::parse_command_line_args(argc, argv);
    } catch (const ExecutionError& e) {
        std::cerr << "Error parsing command line arguments: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information." << std::endl;
        print_config_error(e.what());
        return kExitConfigError;
    }

    if (!cli::initialize_logging(options.log_level)) {
        print_config_error("failed to initialize logging");
        return kExitConfigError;
    }

    EngineConfig cfg;
    TradeIntent intent;
    try {
        cfg = cli::load_engine_config(options);
        intent = cli::build_intent(options);
    } catch (const ExecutionError& e) {
        spdlog::error("[Main] Configuration error: {}", e.what());
        print_config_error(e.what());
        return kExitConfigError;
    }

    spdlog::info("[Main] Configuration Summary:");
    spdlog::info("[Main]   Venue: {}", to_string(intent.venue));
    spdlog::info("[Main]   Network: {}", cfg.testnet ? "TESTNET" : "MAINNET");
    spdlog::info("[Main]   Ledger: {}", cfg.ledger.trades_file);

    std::shared_ptr<ILedgerSink> ledger;
    try {
        ledger = std::make_shared<FileLedgerSink>(cfg.ledger.debug_dir, cfg.ledger.trades_file);
    } catch (const std::exception& e) {
        spdlog::error("[Main] Cannot open ledger: {}", e.what());
        print_config_error(std::string("cannot open ledger: ") + e.what());
        return kExitConfigError;
    }

    ExecutionCoordinator coordinator(make_router(cfg), ledger);
    const ExecutionResult result = coordinator.execute(intent);

    std::cout << engine::serialize_execution_result(result) << std::endl;
    spdlog::shutdown();
    return result.success ? kExitSuccess : kExitFailure;
}
