/**
 * @file execution_coordinator.h
 * @brief Validates an intent, dispatches it to its venue adapter and records exactly one result.
 */

#pragma once

#include "core/reasons/reason_mapper.h"
#include "engine/execution_context.h"
#include "engine/execution_result.h"
#include "engine/ledger_sink.h"
#include "engine/trade_intent.h"
#include "engine/venue_router.h"

#include <memory>

namespace tradegate {

/**
 * @class ExecutionCoordinator
 * @brief The single catch boundary of the engine.
 *
 * execute() never throws for venue, transport or input failures: every
 * attempt produces one ExecutionResult, which is appended to the ledger once
 * (a failing ledger is logged and does not alter the result) and returned.
 * Independent coordinators may run concurrently; one instance is safe to use
 * from several threads as long as its adapters and sink are.
 */
class ExecutionCoordinator {
public:
    ExecutionCoordinator(VenueRouter router,
                         std::shared_ptr<ILedgerSink> ledger,
                         std::shared_ptr<const IReasonMapper> reasons = std::make_shared<DefaultReasonMapper>());

    ExecutionResult execute(const TradeIntent& intent);

    /// Input checks that need no network. @throws InputError
    void validate(const TradeIntent& intent) const;

private:
    void apply_fill(const VenueFill& fill, ExecutionResult& result) const;
    void apply_failure(ErrorKind kind, const std::string& venue_code, const std::string& message,
                       const std::string& raw_response, ExecutionResult& result) const;
    void record(const ExecutionResult& result) const;

    VenueRouter router_;
    std::shared_ptr<ILedgerSink> ledger_;
    std::shared_ptr<const IReasonMapper> reasons_;
};

} // namespace tradegate
