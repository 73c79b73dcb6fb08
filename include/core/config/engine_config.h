/**
 * @file engine_config.h
 * @brief Endpoint, timeout and ledger settings for one engine instance.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tradegate {

struct BybitSettings {
    std::string rest_url{"https://api.bybit.com"};
    std::string recv_window{"5000"};
    std::string category{"linear"};
};

struct HyperliquidSettings {
    std::string rest_url{"https://api.hyperliquid.xyz"};
};

struct SolanaSettings {
    std::string rpc_url{"https://api.mainnet-beta.solana.com"};
    std::string jupiter_url{"https://quote-api.jup.ag/v6"};
    std::string commitment{"confirmed"};
    std::chrono::milliseconds confirm_timeout{60000};
    std::chrono::milliseconds poll_interval{2000};
    int broadcast_attempts{3};
    int open_slippage_bps{50};
    int close_slippage_bps{100};
};

struct HttpSettings {
    long connect_timeout_ms{3000};
    long total_timeout_ms{10000};
};

struct LedgerSettings {
    std::string debug_dir{"logs"};
    std::string trades_file{"logs/trades.jsonl"};
};

struct EngineConfig {
    bool testnet{false};
    BybitSettings bybit;
    HyperliquidSettings hyperliquid;
    SolanaSettings solana;
    HttpSettings http;
    LedgerSettings ledger;

    // Built-in endpoints for mainnet or testnet.
    static EngineConfig for_network(bool testnet);
};

class ConfigLoader {
public:
    /**
     * @brief Overlay a YAML file onto cfg. Keys that are absent keep their current value.
     * @throws InputError on unreadable files or mistyped values.
     */
    static void load_from_yaml(const std::string& path, EngineConfig& cfg);

    /// Overlay TRADEGATE_* environment variables (URLs, timeouts, ledger paths).
    static void apply_env_overrides(EngineConfig& cfg);

    /// @throws InputError when a setting is out of range.
    static void validate(const EngineConfig& cfg);
};

} // namespace tradegate
