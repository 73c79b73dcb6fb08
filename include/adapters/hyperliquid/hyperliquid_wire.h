/**
 * @file hyperliquid_wire.h
 * @brief Price/size normalization and action builders for Hyperliquid /exchange.
 */

#pragma once

#include "core/errors.h"
#include "core/util/num_string.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <string>

namespace tradegate::hyperliquid {

/// Perp prices carry at most this many decimals minus the asset's szDecimals.
constexpr int kMaxPerpDecimals = 6;
/// Distance from mid used to emulate a market order with an IOC limit.
constexpr double kMarketSlippage = 0.05;

/**
 * @brief Canonical wire form: 8 decimals max, trailing zeros dropped ("1.50000000" -> "1.5").
 * @throws InputError for NaN/Inf or values that need more than 8 decimals.
 */
inline std::string float_to_wire(double x) {
    if (std::isnan(x) || std::isinf(x)) {
        throw InputError("Cannot convert NaN or Inf to wire format");
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.8f", x);
    if (std::fabs(std::strtod(buffer, nullptr) - x) >= 1e-12 * std::max(1.0, std::fabs(x))) {
        throw InputError(std::string("float_to_wire causes rounding: ") + buffer);
    }
    return util::trim_trailing_zeros(buffer);
}

/// Five significant figures, then at most (6 - szDecimals) decimals.
inline double round_price(double px, int sz_decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.5g", px);
    const int decimals = std::max(0, kMaxPerpDecimals - std::max(0, sz_decimals));
    return util::round_to_decimals(std::strtod(buffer, nullptr), decimals);
}

inline double round_size(double sz, int sz_decimals) {
    return util::round_to_decimals(sz, std::max(0, sz_decimals));
}

inline double aggressive_price(double mid, bool is_buy) {
    return is_buy ? mid * (1.0 + kMarketSlippage) : mid * (1.0 - kMarketSlippage);
}

/// Single IOC limit order action; key order matters for the msgpack hash.
inline nlohmann::ordered_json order_action(int asset, bool is_buy, const std::string& px,
                                           const std::string& sz, bool reduce_only) {
    nlohmann::ordered_json order;
    order["a"] = asset;
    order["b"] = is_buy;
    order["p"] = px;
    order["s"] = sz;
    order["r"] = reduce_only;
    order["t"] = {{"limit", {{"tif", "Ioc"}}}};

    nlohmann::ordered_json action;
    action["type"] = "order";
    action["orders"] = nlohmann::ordered_json::array({order});
    action["grouping"] = "na";
    return action;
}

inline nlohmann::ordered_json update_leverage_action(int asset, int leverage, bool is_cross = true) {
    nlohmann::ordered_json action;
    action["type"] = "updateLeverage";
    action["asset"] = asset;
    action["isCross"] = is_cross;
    action["leverage"] = leverage;
    return action;
}

} // namespace tradegate::hyperliquid
