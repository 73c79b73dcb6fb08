/**
 * @file trade_intent.h
 * @brief Venue-agnostic trade request handed to the execution coordinator.
 */

#pragma once

#include "core/auth/credentials.h"
#include "core/venue.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tradegate {

enum class Side { Buy, Sell };

enum class IntentAction {
    Open,   ///< enter or add to a position
    Close   ///< liquidate the position (reduce-only / full balance swap)
};

struct TradeConstraints {
    std::optional<int> max_slippage_bps;                 ///< swap slippage tolerance
    std::optional<std::chrono::milliseconds> time_limit; ///< caps on-chain confirmation wait
    std::optional<double> min_liquidity;                 ///< carried for callers; not enforced
};

/**
 * @brief One execution request. Immutable once handed to an adapter.
 *
 * `amount` is kept as the caller's decimal string so venues that accept
 * decimal quantities receive exactly what was requested.
 */
struct TradeIntent {
    std::string id;
    Venue venue{Venue::Bybit};
    std::string symbol;
    Side side{Side::Buy};
    std::string amount;
    std::optional<double> leverage;
    std::optional<double> price;
    bool reduce_only{false};
    IntentAction action{IntentAction::Open};
    TradeConstraints constraints;
    auth::VenueCredentials credentials;
};

std::string_view to_string(Side side) noexcept;
std::string_view to_string(IntentAction action) noexcept;
std::optional<Side> parse_side(std::string_view s);

/// Random correlation id of the form "tg-<ms>-<8 hex>".
std::string generate_intent_id();

} // namespace tradegate
