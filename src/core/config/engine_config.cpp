/**
 * @file engine_config.cpp
 */

#include "core/config/engine_config.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace tradegate {

namespace {

void read_string(const YAML::Node& node, const char* key, std::string& out) {
    if (node[key]) out = node[key].as<std::string>();
}

template <typename T>
void read_number(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

void read_ms(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
    if (node[key]) out = std::chrono::milliseconds(node[key].as<long>());
}

void env_string(const char* key, std::string& out) {
    if (const char* v = std::getenv(key); v && *v) out = v;
}

template <typename T>
void env_number(const char* key, T& out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return;
    char* endp = nullptr;
    const long parsed = std::strtol(v, &endp, 10);
    if (endp && *endp == '\0') {
        out = static_cast<T>(parsed);
    } else {
        spdlog::warn("[ConfigLoader] ignoring non-numeric {}={}", key, v);
    }
}

} // namespace

EngineConfig EngineConfig::for_network(bool testnet) {
    EngineConfig cfg;
    cfg.testnet = testnet;
    if (testnet) {
        cfg.bybit.rest_url = "https://api-testnet.bybit.com";
        cfg.hyperliquid.rest_url = "https://api.hyperliquid-testnet.xyz";
        cfg.solana.rpc_url = "https://api.devnet.solana.com";
    }
    return cfg;
}

void ConfigLoader::load_from_yaml(const std::string& path, EngineConfig& cfg) {
    spdlog::info("[ConfigLoader] Loading configuration from: {}", path);
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto n = root["bybit"]) {
            read_string(n, "rest_url", cfg.bybit.rest_url);
            read_string(n, "recv_window", cfg.bybit.recv_window);
            read_string(n, "category", cfg.bybit.category);
        }
        if (auto n = root["hyperliquid"]) {
            read_string(n, "rest_url", cfg.hyperliquid.rest_url);
        }
        if (auto n = root["solana"]) {
            read_string(n, "rpc_url", cfg.solana.rpc_url);
            read_string(n, "jupiter_url", cfg.solana.jupiter_url);
            read_string(n, "commitment", cfg.solana.commitment);
            read_ms(n, "confirm_timeout_ms", cfg.solana.confirm_timeout);
            read_ms(n, "poll_interval_ms", cfg.solana.poll_interval);
            read_number(n, "broadcast_attempts", cfg.solana.broadcast_attempts);
            read_number(n, "open_slippage_bps", cfg.solana.open_slippage_bps);
            read_number(n, "close_slippage_bps", cfg.solana.close_slippage_bps);
        }
        if (auto n = root["http"]) {
            read_number(n, "connect_timeout_ms", cfg.http.connect_timeout_ms);
            read_number(n, "total_timeout_ms", cfg.http.total_timeout_ms);
        }
        if (auto n = root["ledger"]) {
            read_string(n, "debug_dir", cfg.ledger.debug_dir);
            read_string(n, "trades_file", cfg.ledger.trades_file);
        }
    } catch (const YAML::Exception& e) {
        spdlog::error("[ConfigLoader] YAML error: {}", e.what());
        throw InputError("Failed to load config: " + std::string(e.what()));
    }
}

void ConfigLoader::apply_env_overrides(EngineConfig& cfg) {
    env_string("TRADEGATE_BYBIT_REST_URL", cfg.bybit.rest_url);
    env_string("TRADEGATE_HYPERLIQUID_REST_URL", cfg.hyperliquid.rest_url);
    env_string("TRADEGATE_SOLANA_RPC_URL", cfg.solana.rpc_url);
    env_string("TRADEGATE_JUPITER_URL", cfg.solana.jupiter_url);
    env_string("TRADEGATE_SOLANA_COMMITMENT", cfg.solana.commitment);
    env_number("TRADEGATE_HTTP_CONNECT_TIMEOUT_MS", cfg.http.connect_timeout_ms);
    env_number("TRADEGATE_HTTP_TIMEOUT_MS", cfg.http.total_timeout_ms);
    env_string("TRADEGATE_LEDGER_DIR", cfg.ledger.debug_dir);
    env_string("TRADEGATE_TRADES_FILE", cfg.ledger.trades_file);
}

void ConfigLoader::validate(const EngineConfig& cfg) {
    if (cfg.bybit.rest_url.empty() || cfg.hyperliquid.rest_url.empty() ||
        cfg.solana.rpc_url.empty() || cfg.solana.jupiter_url.empty()) {
        throw InputError("venue endpoint URLs must not be empty");
    }
    if (cfg.solana.commitment != "processed" && cfg.solana.commitment != "confirmed" &&
        cfg.solana.commitment != "finalized") {
        throw InputError("solana.commitment must be processed, confirmed or finalized");
    }
    if (cfg.solana.broadcast_attempts < 1) throw InputError("solana.broadcast_attempts must be >= 1");
    if (cfg.solana.poll_interval.count() <= 0 || cfg.solana.confirm_timeout.count() <= 0) {
        throw InputError("solana confirmation timings must be positive");
    }
    if (cfg.http.connect_timeout_ms < 100 || cfg.http.total_timeout_ms < 200) {
        throw InputError("http timeouts too small (connect >= 100ms, total >= 200ms)");
    }
}

} // namespace tradegate
