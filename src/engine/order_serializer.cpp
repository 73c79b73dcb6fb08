#include "engine/order_serializer.h"
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace tradegate {
namespace engine {

namespace {

rapidjson::Value str(std::string_view s, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(s.data(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

} // namespace

std::string serialize_execution_result(const ExecutionResult& result) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("intentId", str(result.intent_id, allocator), allocator);
    doc.AddMember("success", rapidjson::Value(result.success), allocator);
    doc.AddMember("status", str(to_string(result.status), allocator), allocator);
    doc.AddMember("venue", str(to_string(result.venue), allocator), allocator);
    doc.AddMember("symbol", str(result.symbol, allocator), allocator);
    doc.AddMember("side", str(to_string(result.side), allocator), allocator);

    if (result.tx_hash) {
        doc.AddMember("txHash", str(*result.tx_hash, allocator), allocator);
    }
    if (result.order_id) {
        doc.AddMember("orderId", str(*result.order_id, allocator), allocator);
    }
    if (!result.correlation_id.empty()) {
        doc.AddMember("correlationId", str(result.correlation_id, allocator), allocator);
    }

    doc.AddMember("executedAmount", rapidjson::Value(result.executed_amount), allocator);
    doc.AddMember("executedPrice", rapidjson::Value(result.executed_price), allocator);
    doc.AddMember("fees", rapidjson::Value(result.fees), allocator);
    if (result.slippage_bps) {
        doc.AddMember("slippage", rapidjson::Value(*result.slippage_bps), allocator);
    }
    if (result.execution_time_ms) {
        doc.AddMember("executionTime", rapidjson::Value(static_cast<int64_t>(*result.execution_time_ms)), allocator);
    }

    if (result.error) {
        doc.AddMember("error", str(*result.error, allocator), allocator);
    }
    doc.AddMember("reasonCode", str(result.reason_code, allocator), allocator);
    if (!result.venue_code.empty()) {
        doc.AddMember("venueCode", str(result.venue_code, allocator), allocator);
    }
    doc.AddMember("retryable", rapidjson::Value(result.retryable), allocator);
    if (!result.stage.empty()) {
        doc.AddMember("stage", str(result.stage, allocator), allocator);
    }
    if (!result.message.empty()) {
        doc.AddMember("message", str(result.message, allocator), allocator);
    }

    if (!result.warnings.empty()) {
        rapidjson::Value warnings(rapidjson::kArrayType);
        for (const auto& w : result.warnings) {
            warnings.PushBack(str(w, allocator), allocator);
        }
        doc.AddMember("warnings", warnings, allocator);
    }

    if (!result.venue_statuses.empty()) {
        rapidjson::Document statuses(&allocator);
        statuses.Parse(result.venue_statuses.c_str());
        if (statuses.HasParseError()) {
            doc.AddMember("venueStatuses", str(result.venue_statuses, allocator), allocator);
        } else {
            rapidjson::Value copy(statuses, allocator);
            doc.AddMember("venueStatuses", copy, allocator);
        }
    }

    doc.AddMember("timestamp", rapidjson::Value(static_cast<int64_t>(result.timestamp_ms)), allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

} // namespace engine
} // namespace tradegate
