/**
 * @file trade_intent.cpp
 */

#include "engine/trade_intent.h"
#include "core/auth/monotonic_clock.h"
#include "core/errors.h"
#include "core/util/encoding.h"
#include "utils/string_utils.h"

#include <openssl/rand.h>

namespace tradegate {

std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "buy" : "sell";
}

std::string_view to_string(IntentAction action) noexcept {
    return action == IntentAction::Open ? "open" : "close";
}

std::optional<Side> parse_side(std::string_view s) {
    const auto lower = utils::to_lower_ascii(utils::trim_ascii(s));
    if (lower == "buy" || lower == "long") return Side::Buy;
    if (lower == "sell" || lower == "short") return Side::Sell;
    return std::nullopt;
}

std::string generate_intent_id() {
    std::uint8_t rnd[4];
    if (RAND_bytes(rnd, sizeof(rnd)) != 1) {
        throw ExecutionError(ErrorKind::Internal, "RAND_bytes failed");
    }
    return "tg-" + std::to_string(auth::MonotonicClock::wall_ms()) + "-" + util::hex_encode(rnd, sizeof(rnd));
}

} // namespace tradegate
