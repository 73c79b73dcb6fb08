/**
 * @file hyperliquid_adapter.h
 * @brief Hyperliquid perpetuals: IOC limit orders signed as L1 actions.
 */

#pragma once

#include "adapters/hyperliquid/hyperliquid_signer.h"
#include "adapters/venue_adapter.h"
#include "core/auth/monotonic_clock.h"
#include "core/config/engine_config.h"
#include "core/net/http_client.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tradegate {

class SubmissionTracker;

/**
 * @class HyperliquidAdapter
 * @brief resolve asset -> (updateLeverage) -> price -> build -> sign -> POST /exchange.
 *
 * The venue has no market order type; without an explicit price the order is
 * an IOC limit 5% through the mid. Nonces come from one MonotonicClock shared
 * by every execution of this adapter, so they strictly increase per process.
 */
class HyperliquidAdapter final : public IVenueAdapter {
public:
    using SignerFactory =
        std::function<std::unique_ptr<hyperliquid::IHyperliquidSigner>(const std::string& private_key)>;

    HyperliquidAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                       HyperliquidSettings settings,
                       bool is_mainnet,
                       std::shared_ptr<auth::MonotonicClock> nonces = std::make_shared<auth::MonotonicClock>(),
                       SignerFactory signer_factory = {});

    Venue venue() const override { return Venue::Hyperliquid; }
    VenueFill execute(const TradeIntent& intent, ExecutionContext& ctx) override;

    /// {action, nonce, signature, vaultAddress}
    static nlohmann::ordered_json build_exchange_request(const nlohmann::ordered_json& action,
                                                         std::uint64_t nonce,
                                                         const hyperliquid::HlSignature& sig,
                                                         const std::optional<std::string>& vault_address);

private:
    nlohmann::json submit_action(const nlohmann::ordered_json& action,
                                 const hyperliquid::IHyperliquidSigner& signer,
                                 const std::optional<std::string>& vault_address,
                                 ExecutionContext& ctx,
                                 const char* label,
                                 SubmissionTracker* tracker) const;

    void update_leverage(int asset, double leverage,
                         const hyperliquid::IHyperliquidSigner& signer,
                         const std::optional<std::string>& vault_address,
                         ExecutionContext& ctx) const;

    std::shared_ptr<const nethttp::IHttpClient> http_;
    HyperliquidSettings settings_;
    bool is_mainnet_;
    std::shared_ptr<auth::MonotonicClock> nonces_;
    SignerFactory signer_factory_;
};

} // namespace tradegate
