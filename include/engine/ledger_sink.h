/**
 * @file ledger_sink.h
 * @brief Append-only destinations for request traces and execution results.
 */

#pragma once

#include "core/venue.h"
#include "engine/execution_result.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog { class logger; }

namespace tradegate {

class ILedgerSink {
public:
    virtual ~ILedgerSink() = default;
    // High-verbosity per-venue trace (every request/response pair).
    virtual void trace(Venue venue, std::string_view label, std::string_view payload) = 0;
    // Durable trade ledger: one line per attempt.
    virtual void append(const ExecutionResult& result) = 0;
};

/**
 * @class FileLedgerSink
 * @brief `<debug_dir>/<venue>_debug.log` traces and a JSON-lines trade ledger.
 *
 * Loggers are private to the sink (not registered with spdlog) so several
 * sinks can coexist in one process.
 */
class FileLedgerSink final : public ILedgerSink {
public:
    FileLedgerSink(std::string debug_dir, std::string trades_file);
    ~FileLedgerSink() override;

    void trace(Venue venue, std::string_view label, std::string_view payload) override;
    void append(const ExecutionResult& result) override;

private:
    std::shared_ptr<spdlog::logger> debug_logger(Venue venue);

    std::string debug_dir_;
    std::string trades_file_;
    std::mutex mutex_;
    std::map<Venue, std::shared_ptr<spdlog::logger>> debug_loggers_;
    std::shared_ptr<spdlog::logger> trades_logger_;
};

/// In-memory sink for tests; can be told to throw to exercise sink-failure handling.
class MemoryLedgerSink final : public ILedgerSink {
public:
    struct TraceEntry {
        Venue venue;
        std::string label;
        std::string payload;
    };

    void trace(Venue venue, std::string_view label, std::string_view payload) override;
    void append(const ExecutionResult& result) override;

    std::vector<TraceEntry> traces() const;
    std::vector<ExecutionResult> results() const;
    std::size_t append_calls() const;

    void set_fail_appends(bool fail) { fail_appends_ = fail; }
    void set_fail_traces(bool fail) { fail_traces_ = fail; }

private:
    mutable std::mutex mutex_;
    std::vector<TraceEntry> traces_;
    std::vector<ExecutionResult> results_;
    std::size_t append_calls_{0};
    bool fail_appends_{false};
    bool fail_traces_{false};
};

} // namespace tradegate
