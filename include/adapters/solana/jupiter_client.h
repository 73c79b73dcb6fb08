/**
 * @file jupiter_client.h
 * @brief Jupiter aggregator v6: quote and unsigned swap transaction.
 */

#pragma once

#include "core/net/http_client.h"

#include <cstdint>
#include <memory>
#include <string>

namespace tradegate {
class ExecutionContext;
}

namespace tradegate::solana {

inline constexpr const char* kUsdcMint = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
inline constexpr const char* kWrappedSolMint = "So11111111111111111111111111111111111111112";

struct JupiterQuote {
    std::string raw;                 ///< verbatim quote object, echoed back to /swap
    std::uint64_t in_amount{0};
    std::uint64_t out_amount{0};
    double price_impact_pct{0.0};    ///< percent, as reported
};

/**
 * @class JupiterClient
 * @brief GET /quote then POST /swap. A body carrying "error" is a VenueRejection
 * whose venue code is Jupiter's errorCode when present.
 */
class JupiterClient {
public:
    JupiterClient(std::shared_ptr<const nethttp::IHttpClient> http,
                  std::string base_url,
                  ExecutionContext* ctx = nullptr);

    JupiterQuote quote(const std::string& input_mint,
                       const std::string& output_mint,
                       std::uint64_t amount,
                       int slippage_bps) const;

    /// Base64 of the unsigned (versioned) swap transaction for `user_public_key`.
    std::string swap_transaction(const JupiterQuote& quote, const std::string& user_public_key) const;

private:
    std::shared_ptr<const nethttp::IHttpClient> http_;
    std::string base_url_;
    ExecutionContext* ctx_;
};

} // namespace tradegate::solana
