/**
 * @file exec_dto.h
 * @brief JSON intent document parser for the programmatic entry point.
 */

#pragma once

#include "core/auth/credentials_resolver.h"
#include "engine/trade_intent.h"

#include <string_view>

namespace tradegate {

/**
 * @brief A parsed intent plus whatever credential fields the document carried.
 *
 * Credentials stay raw here; resolve_credentials() turns them into the venue's
 * variant, falling back to the environment for anything missing.
 */
struct IntentRequest {
    TradeIntent intent;
    auth::CliCredentialInputs credentials;
};

/**
 * @brief Parse an intent document.
 *
 * {"id","venue","symbol","side","amount","leverage","price","reduce_only",
 *  "action":"open|close","constraints":{"max_slippage_bps","time_limit_ms",
 *  "min_liquidity"},"credentials":{"api_key","api_secret","private_key",
 *  "wallet_address","vault_address"}}
 *
 * Numbers may be given as JSON numbers or decimal strings. A missing id is
 * generated.
 * @throws InputError on malformed JSON, unknown venue/side/action or mistyped fields.
 */
IntentRequest parse_trade_intent_json(std::string_view json);

} // namespace tradegate
