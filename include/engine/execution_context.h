/**
 * @file execution_context.h
 * @brief Per-execution state shared between the coordinator and one adapter call.
 */

#pragma once

#include "engine/ledger_sink.h"
#include "engine/trade_intent.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

enum class Stage {
    Validate,
    Resolve,
    Prepare,
    Quote,
    Build,
    Sign,
    Submit,
    Confirm,
    Done
};

std::string_view to_string(Stage stage) noexcept;

/**
 * @class ExecutionContext
 * @brief Stage tracking, request tracing and warnings for a single attempt.
 *
 * Not thread-safe; one context belongs to one execution. Trace failures in
 * the sink are logged and dropped.
 */
class ExecutionContext {
public:
    ExecutionContext(const TradeIntent& intent, ILedgerSink* sink);

    const TradeIntent& intent() const { return intent_; }

    void enter(Stage stage);
    Stage stage() const { return stage_; }

    void record_request(std::string_view label, std::string_view payload);
    void record_response(std::string_view label, std::string_view payload);
    const std::string& last_response() const { return last_response_; }

    void warn(std::string message);
    const std::vector<std::string>& warnings() const { return warnings_; }

    // Venue identifier known before the outcome is (e.g. a broadcast tx signature).
    void set_reference(std::string reference) { reference_ = std::move(reference); }
    const std::optional<std::string>& reference() const { return reference_; }

    std::chrono::milliseconds elapsed() const;

private:
    void trace(std::string_view label, std::string_view payload);

    const TradeIntent& intent_;
    ILedgerSink* sink_;
    Stage stage_{Stage::Validate};
    std::string last_response_;
    std::vector<std::string> warnings_;
    std::optional<std::string> reference_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace tradegate
