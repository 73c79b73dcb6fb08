/**
 * @file venue_adapter.h
 * @brief Capability interface every venue implements: resolve, quote, build, sign, submit, confirm.
 */

#pragma once

#include "core/venue.h"
#include "engine/execution_context.h"
#include "engine/execution_result.h"
#include "engine/trade_intent.h"

#include <memory>
#include <optional>
#include <string>

namespace tradegate {

/**
 * @brief What a venue reported for a successful (or no-op) execution.
 *
 * The coordinator turns this into an ExecutionResult; failures are reported
 * by throwing ExecutionError instead.
 */
struct VenueFill {
    ExecutionStatus status{ExecutionStatus::Submitted};
    std::optional<std::string> order_id;
    std::optional<std::string> tx_hash;
    std::string correlation_id;
    double executed_amount{0.0};
    double executed_price{0.0};
    double fees{0.0};
    std::optional<double> slippage_bps;
    std::string message;
    std::string venue_statuses;
};

/**
 * @class IVenueAdapter
 * @brief Drives one intent through a venue's full request sequence.
 *
 * execute() either returns a VenueFill or throws ExecutionError (or a
 * subclass) carrying the failure kind, venue code and raw response. Each
 * stage is announced through ctx.enter() so failures can be located.
 * Adapters hold no per-execution state and may serve concurrent calls.
 */
class IVenueAdapter {
public:
    using Ptr = std::unique_ptr<IVenueAdapter>;

    virtual ~IVenueAdapter() = default;

    virtual Venue venue() const = 0;
    virtual VenueFill execute(const TradeIntent& intent, ExecutionContext& ctx) = 0;
};

} // namespace tradegate
