/**
 * @file execution_result.h
 * @brief The single cross-venue outcome record of one execution attempt.
 */

#pragma once

#include "core/venue.h"
#include "engine/trade_intent.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

enum class ExecutionStatus {
    Filled,      ///< venue reports a fill / settled swap
    Submitted,   ///< accepted by the venue, fill not reported
    NoPosition,  ///< close with nothing to close; a success
    Rejected,    ///< refused by the venue or by input validation
    Failed,      ///< transport, signing or on-chain failure
    Unknown      ///< broadcast accepted, settlement not observed in time
};

std::string_view to_string(ExecutionStatus status) noexcept;

struct ExecutionResult {
    std::string intent_id;
    bool success{false};
    ExecutionStatus status{ExecutionStatus::Failed};
    Venue venue{Venue::Bybit};
    std::string symbol;
    Side side{Side::Buy};

    std::optional<std::string> tx_hash;
    std::optional<std::string> order_id;
    std::string correlation_id;

    double executed_amount{0.0};
    double executed_price{0.0};
    double fees{0.0};
    std::optional<double> slippage_bps;
    std::optional<std::int64_t> execution_time_ms;

    std::optional<std::string> error;
    std::string reason_code{"ok"};
    std::string venue_code;
    bool retryable{false};
    std::string stage;
    std::string message;
    std::vector<std::string> warnings;
    std::string venue_statuses;    ///< raw venue JSON, verbatim
    std::int64_t timestamp_ms{0};
};

} // namespace tradegate
