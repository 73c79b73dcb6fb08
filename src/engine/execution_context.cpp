/**
 * @file execution_context.cpp
 */

#include "engine/execution_context.h"
#include <spdlog/spdlog.h>

namespace tradegate {

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Validate: return "validate";
        case Stage::Resolve: return "resolve";
        case Stage::Prepare: return "prepare";
        case Stage::Quote: return "quote";
        case Stage::Build: return "build";
        case Stage::Sign: return "sign";
        case Stage::Submit: return "submit";
        case Stage::Confirm: return "confirm";
        case Stage::Done: return "done";
    }
    return "unknown";
}

ExecutionContext::ExecutionContext(const TradeIntent& intent, ILedgerSink* sink)
    : intent_(intent), sink_(sink), started_(std::chrono::steady_clock::now()) {}

void ExecutionContext::enter(Stage stage) {
    stage_ = stage;
    spdlog::debug("[Execution] {} stage={}", intent_.id, to_string(stage));
}

void ExecutionContext::record_request(std::string_view label, std::string_view payload) {
    trace(std::string(label) + " request", payload);
}

void ExecutionContext::record_response(std::string_view label, std::string_view payload) {
    last_response_.assign(payload.begin(), payload.end());
    trace(std::string(label) + " response", payload);
}

void ExecutionContext::warn(std::string message) {
    spdlog::warn("[Execution] {} {}", intent_.id, message);
    warnings_.push_back(std::move(message));
}

std::chrono::milliseconds ExecutionContext::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
}

void ExecutionContext::trace(std::string_view label, std::string_view payload) {
    if (!sink_) return;
    try {
        sink_->trace(intent_.venue, label, payload);
    } catch (const std::exception& e) {
        spdlog::warn("[Execution] {} debug trace write failed: {}", intent_.id, e.what());
    }
}

} // namespace tradegate
