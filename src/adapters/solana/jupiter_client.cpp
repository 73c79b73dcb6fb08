/**
 * @file jupiter_client.cpp
 */

#include "adapters/solana/jupiter_client.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "engine/execution_context.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

namespace tradegate::solana {

namespace {

// Jupiter reports amounts as decimal strings.
std::uint64_t amount_member(const rapidjson::Value& obj, const char* key, const std::string& raw) {
    if (!obj.HasMember(key) || !obj[key].IsString()) {
        throw VenueRejection(std::string("Jupiter quote missing ") + key, {}, raw);
    }
    const auto units = util::to_base_units(obj[key].GetString(), 0);
    if (!units) throw VenueRejection(std::string("Jupiter quote has bad ") + key, {}, raw);
    return *units;
}

void throw_if_error(const rapidjson::Document& doc, const char* what, const std::string& raw) {
    if (!doc.HasMember("error") || doc["error"].IsNull()) return;
    std::string message = doc["error"].IsString() ? doc["error"].GetString() : "unknown error";
    std::string code;
    if (doc.HasMember("errorCode") && doc["errorCode"].IsString()) code = doc["errorCode"].GetString();
    spdlog::error("[JupiterClient] {} error: {}", what, message);
    throw VenueRejection(std::string("Jupiter ") + what + " error: " + message, code, raw);
}

} // namespace

JupiterClient::JupiterClient(std::shared_ptr<const nethttp::IHttpClient> http,
                             std::string base_url,
                             ExecutionContext* ctx)
    : http_(std::move(http)), base_url_(std::move(base_url)), ctx_(ctx) {}

JupiterQuote JupiterClient::quote(const std::string& input_mint,
                                  const std::string& output_mint,
                                  std::uint64_t amount,
                                  int slippage_bps) const {
    const std::string url = base_url_ + "/quote?" + nethttp::build_query({
        {"inputMint", input_mint},
        {"outputMint", output_mint},
        {"amount", std::to_string(amount)},
        {"slippageBps", std::to_string(slippage_bps)},
    });
    if (ctx_) ctx_->record_request("quote", "GET " + url);
    JupiterQuote q;
    q.raw = http_->get(url);
    if (ctx_) ctx_->record_response("quote", q.raw);

    rapidjson::Document doc;
    doc.Parse(q.raw.c_str());
    if (doc.HasParseError() || !doc.IsObject()) throw VenueRejection("malformed Jupiter quote", {}, q.raw);
    throw_if_error(doc, "quote", q.raw);

    q.in_amount = amount_member(doc, "inAmount", q.raw);
    q.out_amount = amount_member(doc, "outAmount", q.raw);
    if (doc.HasMember("priceImpactPct")) {
        const auto& impact = doc["priceImpactPct"];
        if (impact.IsString()) {
            q.price_impact_pct = util::parse_decimal(impact.GetString()).value_or(0.0);
        } else if (impact.IsNumber()) {
            q.price_impact_pct = impact.GetDouble();
        }
    }
    spdlog::info("[JupiterClient] Quote received: {} -> {} (impact {}%)", q.in_amount, q.out_amount,
                 q.price_impact_pct);
    return q;
}

std::string JupiterClient::swap_transaction(const JupiterQuote& quote, const std::string& user_public_key) const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("quoteResponse");
    writer.RawValue(quote.raw.c_str(), quote.raw.size(), rapidjson::kObjectType);
    writer.Key("userPublicKey"); writer.String(user_public_key.c_str());
    writer.Key("wrapAndUnwrapSol"); writer.Bool(true);
    writer.Key("dynamicComputeUnitLimit"); writer.Bool(true);
    writer.Key("prioritizationFeeLamports"); writer.String("auto");
    writer.EndObject();
    const std::string body = buffer.GetString();

    if (ctx_) ctx_->record_request("swap", body);
    const std::string raw = http_->post_json(base_url_ + "/swap", body);
    if (ctx_) ctx_->record_response("swap", raw);

    rapidjson::Document doc;
    doc.Parse(raw.c_str());
    if (doc.HasParseError() || !doc.IsObject()) throw VenueRejection("malformed Jupiter swap response", {}, raw);
    throw_if_error(doc, "swap", raw);
    if (!doc.HasMember("swapTransaction") || !doc["swapTransaction"].IsString()) {
        throw VenueRejection("Jupiter swap response has no swapTransaction", {}, raw);
    }
    return doc["swapTransaction"].GetString();
}

} // namespace tradegate::solana
