/**
 * @file execution_coordinator.cpp
 */

#include "engine/execution_coordinator.h"
#include "adapters/venue_adapter.h"
#include "core/auth/monotonic_clock.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "utils/string_utils.h"

#include <spdlog/spdlog.h>

namespace tradegate {

namespace {

ExecutionStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SettlementUnknown:
            return ExecutionStatus::Unknown;
        case ErrorKind::Input:
        case ErrorKind::Resolution:
        case ErrorKind::VenueRejection:
            return ExecutionStatus::Rejected;
        case ErrorKind::Signing:
        case ErrorKind::Transport:
        case ErrorKind::Internal:
            return ExecutionStatus::Failed;
    }
    return ExecutionStatus::Failed;
}

} // namespace

ExecutionCoordinator::ExecutionCoordinator(VenueRouter router,
                                           std::shared_ptr<ILedgerSink> ledger,
                                           std::shared_ptr<const IReasonMapper> reasons)
    : router_(std::move(router)), ledger_(std::move(ledger)), reasons_(std::move(reasons)) {}

void ExecutionCoordinator::validate(const TradeIntent& intent) const {
    if (utils::trim_ascii(intent.symbol).empty()) throw InputError("symbol is required");
    if (intent.action != IntentAction::Close) {
        const auto amount = util::parse_decimal(utils::trim_ascii(intent.amount));
        if (!amount || *amount <= 0.0) throw InputError("amount must be a positive number: '" + intent.amount + "'");
    }
    if (intent.leverage && !(*intent.leverage >= 1.0)) {
        throw InputError("leverage must be >= 1");
    }
    if (intent.price && !(*intent.price > 0.0)) {
        throw InputError("price must be positive");
    }
    if (!auth::credentials_match(intent.venue, intent.credentials)) {
        throw InputError(std::string("credentials do not match venue ") + std::string(to_string(intent.venue)));
    }
    if (!router_.get(intent.venue)) {
        throw InputError(std::string("no adapter registered for ") + std::string(to_string(intent.venue)));
    }
}

ExecutionResult ExecutionCoordinator::execute(const TradeIntent& intent) {
    ExecutionResult result;
    result.intent_id = intent.id;
    result.venue = intent.venue;
    result.symbol = intent.symbol;
    result.side = intent.side;
    result.correlation_id = intent.id;

    spdlog::info("[ExecutionCoordinator] {} {} {} {} {} on {}", intent.id, to_string(intent.action),
                 to_string(intent.side), intent.amount, intent.symbol, to_string(intent.venue));

    ExecutionContext ctx(intent, ledger_.get());
    try {
        ctx.enter(Stage::Validate);
        validate(intent);
        const VenueFill fill = router_.get(intent.venue)->execute(intent, ctx);
        ctx.enter(Stage::Done);
        apply_fill(fill, result);
    } catch (const ExecutionError& e) {
        apply_failure(e.kind(), e.venue_code(), e.what(), e.raw_response(), result);
    } catch (const std::exception& e) {
        apply_failure(ErrorKind::Internal, {}, e.what(), {}, result);
    }

    result.stage = std::string(to_string(ctx.stage()));
    result.warnings = ctx.warnings();
    result.execution_time_ms = ctx.elapsed().count();
    result.timestamp_ms = static_cast<std::int64_t>(auth::MonotonicClock::wall_ms());
    if (!result.tx_hash && ctx.reference()) {
        result.tx_hash = *ctx.reference();
    }

    if (result.success) {
        spdlog::info("[ExecutionCoordinator] {} {} in {}ms", result.intent_id, to_string(result.status),
                     *result.execution_time_ms);
    } else {
        spdlog::error("[ExecutionCoordinator] {} {} at stage {}: {} ({})", result.intent_id,
                      to_string(result.status), result.stage, result.error.value_or(""), result.reason_code);
    }

    record(result);
    return result;
}

void ExecutionCoordinator::apply_fill(const VenueFill& fill, ExecutionResult& result) const {
    result.success = true;
    result.status = fill.status;
    result.order_id = fill.order_id;
    result.tx_hash = fill.tx_hash;
    if (!fill.correlation_id.empty()) result.correlation_id = fill.correlation_id;
    result.executed_amount = fill.executed_amount;
    result.executed_price = fill.executed_price;
    result.fees = fill.fees;
    result.slippage_bps = fill.slippage_bps;
    result.message = fill.message;
    result.venue_statuses = fill.venue_statuses;
    result.reason_code = "ok";
    result.retryable = false;
}

void ExecutionCoordinator::apply_failure(ErrorKind kind, const std::string& venue_code, const std::string& message,
                                         const std::string& raw_response, ExecutionResult& result) const {
    const auto mapping = reasons_->map_failure(kind, venue_code, message);
    result.success = false;
    result.status = status_for(kind);
    result.error = message;
    result.reason_code = mapping.reason_code;
    result.message = mapping.reason_text;
    result.venue_code = venue_code;
    result.retryable = kind == ErrorKind::Transport || kind == ErrorKind::SettlementUnknown;
    result.venue_statuses = raw_response;
}

void ExecutionCoordinator::record(const ExecutionResult& result) const {
    if (!ledger_) return;
    try {
        ledger_->append(result);
    } catch (const std::exception& e) {
        spdlog::error("[ExecutionCoordinator] Ledger append failed for {}: {}", result.intent_id, e.what());
    }
}

} // namespace tradegate
