/**
 * @file solana_rpc_client.h
 * @brief The handful of Solana JSON-RPC calls the swap flow needs.
 */

#pragma once

#include "core/net/http_client.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tradegate {
class ExecutionContext;
}

namespace tradegate::solana {

struct TokenBalance {
    std::uint64_t amount{0};   ///< raw base units
    int decimals{0};
    double ui_amount{0.0};
};

struct SignatureStatus {
    std::string confirmation_status;   ///< processed | confirmed | finalized
    std::optional<std::string> err;    ///< on-chain error as JSON text
};

/// processed < confirmed < finalized; unknown levels rank below processed.
int commitment_rank(const std::string& level);

/**
 * @class SolanaRpcClient
 * @brief JSON-RPC 2.0 over IHttpClient. Every request/response pair is traced
 * through the execution context when one is given.
 *
 * RPC-level errors ({"error":{code,message}}) are thrown as VenueRejection with
 * the RPC code; transport faults propagate from the HTTP client unchanged.
 */
class SolanaRpcClient {
public:
    using Writer = rapidjson::Writer<rapidjson::StringBuffer>;
    using ParamsWriter = std::function<void(Writer&)>;

    SolanaRpcClient(std::shared_ptr<const nethttp::IHttpClient> http,
                    std::string rpc_url,
                    ExecutionContext* ctx = nullptr);

    /// First token account of `owner` for `mint`; zero when none exists.
    TokenBalance token_balance(const std::string& owner, const std::string& mint) const;

    /// Decimals of an SPL mint, nullopt if the account is missing or unparsed.
    std::optional<int> mint_decimals(const std::string& mint) const;

    /// Broadcast a signed base64 transaction; returns the signature the node reports.
    std::string send_transaction(const std::string& base64_tx, const std::string& preflight_commitment) const;

    /// nullopt while the cluster has not seen the signature.
    std::optional<SignatureStatus> signature_status(const std::string& signature) const;

    /// Raw call: writes the request, returns the response with `result` validated present.
    std::string call(const char* method, const ParamsWriter& params, rapidjson::Document& doc) const;

private:
    std::shared_ptr<const nethttp::IHttpClient> http_;
    std::string rpc_url_;
    ExecutionContext* ctx_;
};

} // namespace tradegate::solana
