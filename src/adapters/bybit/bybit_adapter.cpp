/**
 * @file bybit_adapter.cpp
 */

#include "adapters/bybit/bybit_adapter.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "utils/string_utils.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

namespace tradegate {

namespace {

const char* string_member(const rapidjson::Value& obj, const char* key) {
    if (obj.IsObject() && obj.HasMember(key) && obj[key].IsString()) return obj[key].GetString();
    return "";
}

} // namespace

BybitAdapter::BybitAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                           BybitSettings settings,
                           std::shared_ptr<auth::MonotonicClock> clock)
    : http_(std::move(http)),
      settings_(std::move(settings)),
      auth_(std::move(clock), settings_.recv_window) {}

std::string BybitAdapter::build_leverage_body(const std::string& symbol, double leverage) const {
    const std::string lev = util::format_decimal(leverage, 2);
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("category"); writer.String(settings_.category.c_str());
    writer.Key("symbol"); writer.String(symbol.c_str());
    writer.Key("buyLeverage"); writer.String(lev.c_str());
    writer.Key("sellLeverage"); writer.String(lev.c_str());
    writer.EndObject();
    return buffer.GetString();
}

std::string BybitAdapter::build_order_body(const std::string& symbol, Side side, const std::string& qty,
                                           bool reduce_only, const std::string& order_link_id) const {
    const std::string side_str = utils::capitalize_ascii(to_string(side));
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("category"); writer.String(settings_.category.c_str());
    writer.Key("symbol"); writer.String(symbol.c_str());
    writer.Key("side"); writer.String(side_str.c_str());
    writer.Key("orderType"); writer.String("Market");
    writer.Key("qty"); writer.String(qty.c_str());
    if (reduce_only) {
        writer.Key("reduceOnly"); writer.Bool(true);
    }
    if (!order_link_id.empty()) {
        writer.Key("orderLinkId"); writer.String(order_link_id.c_str());
    }
    writer.EndObject();
    return buffer.GetString();
}

BybitAdapter::Reply BybitAdapter::signed_post(const std::string& path,
                                              const std::string& body,
                                              const auth::ApiKeyCredentials& creds,
                                              ExecutionContext& ctx,
                                              const char* label) const {
    std::string timestamp;
    const auto kv = auth_.build_headers("POST", path, body, creds.api_key, creds.api_secret, timestamp);
    std::vector<nethttp::Header> headers;
    headers.reserve(kv.size());
    for (const auto& h : kv) headers.push_back({h.name, h.value});

    ctx.record_request(label, "POST " + path + " ts=" + timestamp + " " + body);
    Reply reply;
    reply.raw = http_->request("POST", settings_.rest_url + path, headers, body);
    ctx.record_response(label, reply.raw);

    rapidjson::Document doc;
    doc.Parse(reply.raw.c_str());
    if (doc.HasParseError() || !doc.IsObject() || !doc.HasMember("retCode") || !doc["retCode"].IsInt()) {
        throw VenueRejection(std::string("malformed Bybit response to ") + label, {}, reply.raw);
    }
    reply.ret_code = doc["retCode"].GetInt();
    reply.ret_msg = string_member(doc, "retMsg");
    if (doc.HasMember("result") && doc["result"].IsObject()) {
        reply.order_id = string_member(doc["result"], "orderId");
        reply.order_link_id = string_member(doc["result"], "orderLinkId");
    }
    return reply;
}

void BybitAdapter::set_leverage(const std::string& symbol, double leverage,
                                const auth::ApiKeyCredentials& creds, ExecutionContext& ctx) const {
    const auto reply = signed_post("/v5/position/set-leverage", build_leverage_body(symbol, leverage),
                                   creds, ctx, "set-leverage");
    if (reply.ret_code == 0) {
        spdlog::info("[BybitAdapter] Leverage set to {}x for {}", util::format_decimal(leverage, 2), symbol);
    } else if (reply.ret_code == kLeverageNotModified) {
        spdlog::info("[BybitAdapter] Leverage already at {}x for {}", util::format_decimal(leverage, 2), symbol);
    } else {
        ctx.warn("leverage not applied: " + reply.ret_msg + " (code: " + std::to_string(reply.ret_code) + ")");
    }
}

VenueFill BybitAdapter::execute(const TradeIntent& intent, ExecutionContext& ctx) {
    ctx.enter(Stage::Prepare);
    const auto* creds = std::get_if<auth::ApiKeyCredentials>(&intent.credentials);
    if (!creds) throw InputError("Bybit requires API key credentials");
    if (intent.action == IntentAction::Close) {
        throw InputError("Bybit close is not supported; submit a reduce-only order instead");
    }
    const std::string amount = utils::trim_ascii(intent.amount);
    const auto qty = util::parse_decimal(amount);
    if (!qty || *qty <= 0.0) throw InputError("invalid amount: " + intent.amount);

    const std::string symbol = symbols_.to_compact(intent.symbol);
    if (symbol.empty()) throw InputError("empty symbol");

    spdlog::info("[BybitAdapter] Preparing {} {} {} (key {})", symbol,
                 utils::capitalize_ascii(to_string(intent.side)), amount, utils::redact(creds->api_key));

    if (intent.leverage && *intent.leverage > 1.0) {
        set_leverage(symbol, *intent.leverage, *creds, ctx);
    }

    ctx.enter(Stage::Build);
    const std::string body = build_order_body(symbol, intent.side, amount, intent.reduce_only, intent.id);

    ctx.enter(Stage::Submit);
    const auto reply = signed_post("/v5/order/create", body, *creds, ctx, "order");
    if (reply.ret_code != 0) {
        spdlog::error("[BybitAdapter] Order rejected {}: {}", reply.ret_code, reply.ret_msg);
        throw VenueRejection("Bybit error " + std::to_string(reply.ret_code) + ": " + reply.ret_msg,
                             std::to_string(reply.ret_code), reply.raw);
    }

    spdlog::info("[BybitAdapter] Order accepted orderId={} orderLinkId={}", reply.order_id, reply.order_link_id);
    VenueFill fill;
    fill.status = ExecutionStatus::Submitted;
    fill.order_id = reply.order_id;
    fill.correlation_id = reply.order_link_id.empty() ? intent.id : reply.order_link_id;
    fill.executed_amount = *qty;
    fill.message = "order accepted";
    return fill;
}

} // namespace tradegate
