/**
 * @file venue.h
 * @brief Venue identifiers shared by config, credentials and routing.
 */

#pragma once

#include <optional>
#include <string_view>

namespace tradegate {

enum class Venue {
    Bybit,
    Hyperliquid,
    Solana
};

std::string_view to_string(Venue venue) noexcept;

// Case-insensitive; accepts "jupiter" as an alias for Solana.
std::optional<Venue> parse_venue(std::string_view name);

} // namespace tradegate
