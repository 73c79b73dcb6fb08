/**
 * @file solana_jupiter_adapter.h
 * @brief Spot swaps on Solana routed through Jupiter, signed locally.
 */

#pragma once

#include "adapters/venue_adapter.h"
#include "core/config/engine_config.h"
#include "core/net/http_client.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tradegate {

class SubmissionTracker;

namespace solana {
class SolanaRpcClient;
}

/**
 * @class SolanaJupiterAdapter
 * @brief open: quote -> swap tx -> sign -> broadcast -> confirm.
 *        close: balance -> (no position | sell full balance for USDC).
 *
 * The signature is recorded on the context as soon as the transaction is
 * signed. Broadcast is retried on transport faults only, always with the same
 * signed bytes; a rejection that follows a transport fault is not final and
 * falls through to confirmation. Confirmation polls getSignatureStatuses until
 * the configured commitment, an on-chain error, or the deadline (config
 * timeout capped by the intent's time limit). Failed polls are retried. A
 * missed deadline throws SettlementTimeout.
 */
class SolanaJupiterAdapter final : public IVenueAdapter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr int kMinSlippageBps = 1;
    static constexpr int kMaxSlippageBps = 500;

    SolanaJupiterAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                         SolanaSettings settings,
                         Sleeper sleeper = {});

    Venue venue() const override { return Venue::Solana; }
    VenueFill execute(const TradeIntent& intent, ExecutionContext& ctx) override;

private:
    int slippage_for(const TradeIntent& intent) const;
    int token_decimals(const std::string& mint, const solana::SolanaRpcClient& rpc, ExecutionContext& ctx) const;

    /// Returns the node-reported signature, or nullopt when a resend was
    /// rejected after an earlier transport fault left delivery unknown.
    std::optional<std::string> broadcast(const solana::SolanaRpcClient& rpc, const std::string& base64_tx,
                                         SubmissionTracker& tracker, ExecutionContext& ctx) const;
    void await_confirmation(const solana::SolanaRpcClient& rpc, const std::string& signature,
                            std::chrono::milliseconds timeout, SubmissionTracker& tracker,
                            ExecutionContext& ctx) const;

    std::shared_ptr<const nethttp::IHttpClient> http_;
    SolanaSettings settings_;
    Sleeper sleeper_;
};

} // namespace tradegate
