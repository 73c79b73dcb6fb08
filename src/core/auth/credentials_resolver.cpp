/**
 * @file credentials_resolver.cpp
 */

#include "core/auth/credentials_resolver.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <cstdlib>

namespace tradegate::auth {

namespace {
inline std::string getenv_string(const std::string& key) {
    if (const char* v = std::getenv(key.c_str())) return std::string(v);
    return {};
}

inline std::string first_non_empty(const std::string& cli_value, const std::string& env_key) {
    if (!cli_value.empty()) return cli_value;
    return getenv_string(env_key);
}

inline std::optional<std::string> optional_value(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}
} // namespace

bool parse_bool_env(const char* key, bool def_value) {
    const char* v = std::getenv(key);
    if (!v) return def_value;
    const std::string s = utils::to_lower_ascii(utils::trim_ascii(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def_value;
}

VenueCredentials resolve_credentials(Venue venue, const CliCredentialInputs& cli) {
    const std::string prefix = "TRADEGATE_" + utils::to_upper_ascii(to_string(venue)) + "_";

    if (venue == Venue::Bybit) {
        ApiKeyCredentials out;
        out.api_key = first_non_empty(cli.api_key, prefix + "API_KEY");
        out.api_secret = first_non_empty(cli.api_secret, prefix + "API_SECRET");
        if (out.api_key.empty() || out.api_secret.empty()) {
            throw InputError("missing Bybit API key/secret (--api-key/--api-secret or " + prefix + "API_KEY/API_SECRET)");
        }
        return out;
    }

    WalletCredentials out;
    out.private_key = first_non_empty(cli.private_key, prefix + "PRIVATE_KEY");
    if (out.private_key.empty()) {
        throw InputError("missing private key (--private-key or " + prefix + "PRIVATE_KEY)");
    }
    out.wallet_address = optional_value(first_non_empty(cli.wallet_address, prefix + "WALLET_ADDRESS"));
    if (venue == Venue::Hyperliquid) {
        out.vault_address = optional_value(first_non_empty(cli.vault_address, prefix + "VAULT_ADDRESS"));
    }
    return out;
}

} // namespace tradegate::auth
