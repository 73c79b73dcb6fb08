/**
 * @file ledger_sink.cpp
 */

#include "engine/ledger_sink.h"
#include "engine/order_serializer.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <stdexcept>

namespace tradegate {

namespace {

std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name,
                                                 const std::string& path,
                                                 const std::string& pattern) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);
    return logger;
}

} // namespace

FileLedgerSink::FileLedgerSink(std::string debug_dir, std::string trades_file)
    : debug_dir_(std::move(debug_dir)), trades_file_(std::move(trades_file)) {}

FileLedgerSink::~FileLedgerSink() = default;

std::shared_ptr<spdlog::logger> FileLedgerSink::debug_logger(Venue venue) {
    auto it = debug_loggers_.find(venue);
    if (it != debug_loggers_.end()) return it->second;
    const std::string name(to_string(venue));
    auto logger = make_file_logger(name + "_debug",
                                   (std::filesystem::path(debug_dir_) / (name + "_debug.log")).string(),
                                   "%Y-%m-%dT%H:%M:%S.%e - %v");
    debug_loggers_.emplace(venue, logger);
    return logger;
}

void FileLedgerSink::trace(Venue venue, std::string_view label, std::string_view payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_logger(venue)->info("{}: {}", label, payload);
}

void FileLedgerSink::append(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!trades_logger_) {
        trades_logger_ = make_file_logger("trades", trades_file_, "%v");
    }
    trades_logger_->info("{}", engine::serialize_execution_result(result));
}

void MemoryLedgerSink::trace(Venue venue, std::string_view label, std::string_view payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_traces_) throw std::runtime_error("trace sink unavailable");
    traces_.push_back({venue, std::string(label), std::string(payload)});
}

void MemoryLedgerSink::append(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++append_calls_;
    if (fail_appends_) throw std::runtime_error("ledger unavailable");
    results_.push_back(result);
}

std::vector<MemoryLedgerSink::TraceEntry> MemoryLedgerSink::traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<ExecutionResult> MemoryLedgerSink::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::size_t MemoryLedgerSink::append_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return append_calls_;
}

} // namespace tradegate
