/**
 * @file hyperliquid_asset_resolver.h
 * @brief Maps human symbols to Hyperliquid perp asset indices via /info.
 */

#pragma once

#include "core/net/http_client.h"
#include "core/symbol/symbol_mapper.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tradegate {

class ExecutionContext;

struct HlResolution {
    int asset{-1};          // index in meta.universe
    int sz_decimals{0};
    std::string coin;       // universe name, as listed
};

/**
 * @class HyperliquidAssetResolver
 * @brief Per-execution view of the perp universe and mid prices.
 *
 * Metadata is fetched once per resolver instance and never persisted; the
 * adapter creates one resolver per execution.
 */
class HyperliquidAssetResolver {
public:
    HyperliquidAssetResolver(std::shared_ptr<const nethttp::IHttpClient> http,
                             std::string rest_base,
                             ExecutionContext* ctx = nullptr);

    /**
     * @brief Case-insensitive match on the name, then on the symbol with its quote suffix stripped.
     * @throws ResolutionError("asset not found: ...") when nothing matches.
     */
    HlResolution resolve_perp(std::string_view symbol);

    /// Mid price for a universe coin from allMids.
    /// @throws ResolutionError when the coin has no mid.
    double mid_price(const std::string& coin);

    // Parsing helpers, public for tests.
    static std::vector<HlResolution> parse_universe(const std::string& json);
    static std::unordered_map<std::string, double> parse_all_mids(const std::string& json);

private:
    std::string post_info(const std::string& type);
    void ensure_meta();

    std::shared_ptr<const nethttp::IHttpClient> http_;
    std::string rest_base_;
    ExecutionContext* ctx_;
    DefaultSymbolMapper symbols_;

    std::optional<std::vector<HlResolution>> universe_;
    std::unordered_map<std::string, HlResolution> by_upper_name_;
    std::optional<std::unordered_map<std::string, double>> mids_;
};

} // namespace tradegate
