/**
 * @file reason_mapper.cpp
 */

#include "core/reasons/reason_mapper.h"
#include "utils/string_utils.h"

namespace tradegate {

static inline bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string DefaultReasonMapper::canonical_code(std::string_view raw_code) const {
    const std::string lower = utils::to_lower_ascii(raw_code);
    if (lower.empty() || lower == "ok" || lower == "accepted" || lower == "no_position") return "ok";
    if (lower == "invalid_params" || lower == "invalid_parameters" || lower == "invalid_parameter" ||
        lower == "missing_parameters" || lower == "missing_parameter" || lower == "invalid_size" ||
        lower == "invalid_reduce_only" || lower == "parameter_error" || lower == "input") {
        return "invalid_params";
    }
    if (lower == "insufficient_balance" || lower == "balance_insufficient") return "insufficient_balance";
    if (lower == "min_size" || lower == "size_too_small" || lower == "mintradentlrejected") return "min_size";
    if (lower == "price_out_of_bounds" || lower == "price_too_far" || lower == "tickrejected" || lower == "oraclerejected") return "price_out_of_bounds";
    if (lower == "rate_limited" || lower == "too_many_requests") return "rate_limited";
    if (lower == "network_error" || lower == "timeout" || lower == "transport_error" || lower == "transport") return "network_error";
    if (lower == "signing_error" || lower == "signing" || lower == "invalid_signature") return "signing_error";
    if (lower == "not_found" || lower == "asset_not_found" || lower == "resolution") return "not_found";
    if (lower == "unknown_outcome" || lower == "settlement_unknown" || lower == "timed_out") return "unknown_outcome";
    if (lower == "internal_error" || lower == "internal") return "internal_error";
    return "venue_reject";
}

ReasonMapping DefaultReasonMapper::map_rejection(std::string_view raw_reason) const {
    ReasonMapping r;
    const std::string lower = utils::to_lower_ascii(raw_reason);
    r.reason_text = raw_reason.empty() ? std::string("Order rejected") : std::string(raw_reason);
    if (lower.empty()) {
        r.reason_code = "venue_reject";
        return r;
    }
    if (contains(lower, "balance") || contains(lower, "margin") || lower == "perpmarginrejected") {
        r.reason_code = "insufficient_balance";
        return r;
    }
    if (lower == "tickrejected" || lower == "oraclerejected" || contains(lower, "tick size") ||
        contains(lower, "too far from oracle")) {
        r.reason_code = "price_out_of_bounds";
        return r;
    }
    if (lower == "mintradentlrejected" || contains(lower, "minimum value") || contains(lower, "too small")) {
        r.reason_code = "min_size";
        return r;
    }
    if (lower == "reduceonlyrejected" || contains(lower, "reduce only")) {
        r.reason_code = "invalid_params";
        return r;
    }
    if (contains(lower, "rate limit") || contains(lower, "too many")) {
        r.reason_code = "rate_limited";
        return r;
    }
    // IOC with no resting liquidity and everything else the venue refused.
    r.reason_code = "venue_reject";
    return r;
}

ReasonMapping DefaultReasonMapper::map_failure(ErrorKind kind,
                                               std::string_view venue_code,
                                               std::string_view message) const {
    ReasonMapping r;
    r.reason_text = std::string(message);
    switch (kind) {
        case ErrorKind::Input: r.reason_code = "invalid_params"; return r;
        case ErrorKind::Signing: r.reason_code = "signing_error"; return r;
        case ErrorKind::Resolution: r.reason_code = "not_found"; return r;
        case ErrorKind::SettlementUnknown: r.reason_code = "unknown_outcome"; return r;
        case ErrorKind::Internal: r.reason_code = "internal_error"; return r;
        case ErrorKind::Transport:
            r.reason_code = (venue_code == "429") ? "rate_limited" : "network_error";
            return r;
        case ErrorKind::VenueRejection:
            break;
    }

    // Bybit v5 retCodes
    if (venue_code == "10001" || venue_code == "110017") { r.reason_code = "invalid_params"; return r; }
    if (venue_code == "10003" || venue_code == "10004" || venue_code == "10005") { r.reason_code = "signing_error"; return r; }
    if (venue_code == "10006" || venue_code == "429") { r.reason_code = "rate_limited"; return r; }
    if (venue_code == "110004" || venue_code == "110007" || venue_code == "110012") { r.reason_code = "insufficient_balance"; return r; }
    if (venue_code == "110094" || venue_code == "170136") { r.reason_code = "min_size"; return r; }
    if (venue_code == "10002") { r.reason_code = "signing_error"; return r; } // timestamp outside recv window
    return map_rejection(message);
}

} // namespace tradegate
