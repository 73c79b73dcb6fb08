/**
 * @file credentials.h
 * @brief Per-venue secret material. Held in memory for one execution, never logged.
 */

#pragma once

#include "core/venue.h"

#include <optional>
#include <string>
#include <variant>

namespace tradegate::auth {

/// CEX API key pair (HMAC).
struct ApiKeyCredentials {
    std::string api_key;
    std::string api_secret;
};

/// On-chain signing key. The address is derived from the key when absent.
struct WalletCredentials {
    std::string private_key;
    std::optional<std::string> wallet_address;
    std::optional<std::string> vault_address;   // Hyperliquid sub-account / vault
};

using VenueCredentials = std::variant<ApiKeyCredentials, WalletCredentials>;

// True when the variant alternative is the one the venue signs with.
inline bool credentials_match(Venue venue, const VenueCredentials& creds) {
    if (venue == Venue::Bybit) return std::holds_alternative<ApiKeyCredentials>(creds);
    return std::holds_alternative<WalletCredentials>(creds);
}

} // namespace tradegate::auth
