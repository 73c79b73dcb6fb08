/**
 * @file credentials_resolver.h
 * @brief Central resolver for venue credentials (CLI first, then TRADEGATE_* environment).
 */

#pragma once

#include "core/auth/credentials.h"

#include <string>

namespace tradegate::auth {

/// Raw credential flags as given on the command line; empty means "not given".
struct CliCredentialInputs {
    std::string api_key;
    std::string api_secret;
    std::string private_key;
    std::string wallet_address;
    std::string vault_address;
};

// Parse common truthy/falsey strings from env.
bool parse_bool_env(const char* key, bool def_value);

// Resolve credentials for the given venue using CLI values and environment.
// Throws InputError when the required secret is missing from both.
VenueCredentials resolve_credentials(Venue venue, const CliCredentialInputs& cli);

} // namespace tradegate::auth
