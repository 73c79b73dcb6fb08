/**
 * @file test_config.cpp
 * @brief Layered engine configuration: defaults, YAML, environment, validation
 */

#include <gtest/gtest.h>
#include "core/config/engine_config.h"
#include "core/errors.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace tradegate;

namespace {

std::string write_temp_yaml(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST(EngineConfig, NetworkDefaults) {
    const auto main = EngineConfig::for_network(false);
    EXPECT_EQ(main.bybit.rest_url, "https://api.bybit.com");
    EXPECT_EQ(main.bybit.recv_window, "5000");
    EXPECT_EQ(main.solana.commitment, "confirmed");
    EXPECT_EQ(main.solana.broadcast_attempts, 3);
    EXPECT_EQ(main.solana.open_slippage_bps, 50);
    EXPECT_EQ(main.solana.close_slippage_bps, 100);

    const auto test = EngineConfig::for_network(true);
    EXPECT_TRUE(test.testnet);
    EXPECT_EQ(test.bybit.rest_url, "https://api-testnet.bybit.com");
    EXPECT_EQ(test.hyperliquid.rest_url, "https://api.hyperliquid-testnet.xyz");
    EXPECT_NO_THROW(ConfigLoader::validate(test));
}

TEST(ConfigLoader, YamlOverlaysOnlyGivenKeys) {
    const auto path = write_temp_yaml("tradegate_config_test.yml",
        "solana:\n"
        "  rpc_url: http://localhost:8899\n"
        "  confirm_timeout_ms: 15000\n"
        "  broadcast_attempts: 5\n"
        "ledger:\n"
        "  trades_file: /tmp/tg/trades.jsonl\n");

    auto cfg = EngineConfig::for_network(false);
    ConfigLoader::load_from_yaml(path, cfg);
    EXPECT_EQ(cfg.solana.rpc_url, "http://localhost:8899");
    EXPECT_EQ(cfg.solana.confirm_timeout, std::chrono::milliseconds(15000));
    EXPECT_EQ(cfg.solana.broadcast_attempts, 5);
    EXPECT_EQ(cfg.solana.poll_interval, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.ledger.trades_file, "/tmp/tg/trades.jsonl");
    EXPECT_EQ(cfg.bybit.rest_url, "https://api.bybit.com");
    std::filesystem::remove(path);
}

TEST(ConfigLoader, BadYamlIsInputError) {
    const auto path = write_temp_yaml("tradegate_config_bad.yml", "solana:\n  broadcast_attempts: many\n");
    auto cfg = EngineConfig::for_network(false);
    EXPECT_THROW(ConfigLoader::load_from_yaml(path, cfg), InputError);
    EXPECT_THROW(ConfigLoader::load_from_yaml("/nonexistent/tradegate.yml", cfg), InputError);
    std::filesystem::remove(path);
}

TEST(ConfigLoader, EnvironmentOverridesFile) {
    ::setenv("TRADEGATE_SOLANA_RPC_URL", "http://env-rpc", 1);
    ::setenv("TRADEGATE_HTTP_TIMEOUT_MS", "2500", 1);
    auto cfg = EngineConfig::for_network(false);
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.solana.rpc_url, "http://env-rpc");
    EXPECT_EQ(cfg.http.total_timeout_ms, 2500);
    ::unsetenv("TRADEGATE_SOLANA_RPC_URL");
    ::unsetenv("TRADEGATE_HTTP_TIMEOUT_MS");
}

TEST(ConfigLoader, ValidateRejectsOutOfRange) {
    auto cfg = EngineConfig::for_network(false);
    cfg.solana.commitment = "eventually";
    EXPECT_THROW(ConfigLoader::validate(cfg), InputError);

    cfg = EngineConfig::for_network(false);
    cfg.solana.broadcast_attempts = 0;
    EXPECT_THROW(ConfigLoader::validate(cfg), InputError);

    cfg = EngineConfig::for_network(false);
    cfg.bybit.rest_url.clear();
    EXPECT_THROW(ConfigLoader::validate(cfg), InputError);
}
