/**
 * @file hyperliquid_asset_resolver.cpp
 */

#include "adapters/hyperliquid/hyperliquid_asset_resolver.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "engine/execution_context.h"
#include "utils/string_utils.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>

namespace tradegate {

HyperliquidAssetResolver::HyperliquidAssetResolver(std::shared_ptr<const nethttp::IHttpClient> http,
                                                   std::string rest_base,
                                                   ExecutionContext* ctx)
    : http_(std::move(http)), rest_base_(std::move(rest_base)), ctx_(ctx) {}

std::string HyperliquidAssetResolver::post_info(const std::string& type) {
    const std::string body = std::string("{\"type\":\"") + type + "\"}";
    if (ctx_) ctx_->record_request("info/" + type, body);
    auto response = http_->post_json(rest_base_ + "/info", body);
    if (ctx_) ctx_->record_response("info/" + type, response);
    return response;
}

std::vector<HlResolution> HyperliquidAssetResolver::parse_universe(const std::string& json) {
    rapidjson::Document d;
    d.Parse(json.c_str());
    if (d.HasParseError()) {
        throw ResolutionError(std::string("meta parse error: ") + rapidjson::GetParseError_En(d.GetParseError()), json);
    }
    const rapidjson::Value* arr = nullptr;
    if (d.IsObject() && d.HasMember("universe") && d["universe"].IsArray()) {
        arr = &d["universe"];
    }
    if (!arr) throw ResolutionError("meta response has no universe", json);

    std::vector<HlResolution> out;
    out.reserve(arr->Size());
    int idx = 0;
    for (auto& v : arr->GetArray()) {
        HlResolution res;
        res.asset = idx++;
        if (v.IsObject()) {
            if (v.HasMember("name") && v["name"].IsString()) res.coin = v["name"].GetString();
            if (v.HasMember("szDecimals") && v["szDecimals"].IsInt()) res.sz_decimals = v["szDecimals"].GetInt();
        }
        // Unnamed entries still occupy an index.
        out.push_back(std::move(res));
    }
    return out;
}

std::unordered_map<std::string, double> HyperliquidAssetResolver::parse_all_mids(const std::string& json) {
    rapidjson::Document d;
    d.Parse(json.c_str());
    if (d.HasParseError() || !d.IsObject()) throw ResolutionError("allMids response is not an object", json);
    std::unordered_map<std::string, double> out;
    for (auto it = d.MemberBegin(); it != d.MemberEnd(); ++it) {
        std::optional<double> px;
        if (it->value.IsString()) px = util::parse_decimal(it->value.GetString());
        else if (it->value.IsNumber()) px = it->value.GetDouble();
        if (px) out.emplace(it->name.GetString(), *px);
    }
    return out;
}

void HyperliquidAssetResolver::ensure_meta() {
    if (universe_) return;
    universe_ = parse_universe(post_info("meta"));
    for (const auto& res : *universe_) {
        if (!res.coin.empty()) by_upper_name_.emplace(utils::to_upper_ascii(res.coin), res);
    }
    spdlog::debug("[HyperliquidAssetResolver] universe loaded: {} assets", universe_->size());
}

HlResolution HyperliquidAssetResolver::resolve_perp(std::string_view symbol) {
    ensure_meta();
    for (const auto& candidate : symbols_.perp_candidates(symbol)) {
        auto it = by_upper_name_.find(candidate);
        if (it != by_upper_name_.end()) return it->second;
    }
    throw ResolutionError("asset not found: " + std::string(symbol));
}

double HyperliquidAssetResolver::mid_price(const std::string& coin) {
    if (!mids_) mids_ = parse_all_mids(post_info("allMids"));
    auto it = mids_->find(coin);
    if (it == mids_->end() || it->second <= 0.0) {
        throw ResolutionError("no mid price for " + coin);
    }
    return it->second;
}

} // namespace tradegate
