/**
 * @file venue.cpp
 */

#include "core/venue.h"
#include "utils/string_utils.h"

namespace tradegate {

std::string_view to_string(Venue venue) noexcept {
    switch (venue) {
        case Venue::Bybit: return "bybit";
        case Venue::Hyperliquid: return "hyperliquid";
        case Venue::Solana: return "solana";
    }
    return "unknown";
}

std::optional<Venue> parse_venue(std::string_view name) {
    const auto key = utils::normalize_venue_key(name);
    if (key == "bybit") return Venue::Bybit;
    if (key == "hyperliquid") return Venue::Hyperliquid;
    if (key == "solana" || key == "jupiter") return Venue::Solana;
    return std::nullopt;
}

} // namespace tradegate
