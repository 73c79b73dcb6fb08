/**
 * @file hyperliquid_adapter.cpp
 */

#include "adapters/hyperliquid/hyperliquid_adapter.h"
#include "adapters/hyperliquid/hyperliquid_asset_resolver.h"
#include "adapters/hyperliquid/hyperliquid_wire.h"
#include "core/errors.h"
#include "core/util/num_string.h"
#include "engine/submission_tracker.h"
#include "utils/string_utils.h"

#include <spdlog/spdlog.h>
#include <cmath>

namespace tradegate {

namespace {

std::string json_to_decimal_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) return util::format_decimal(v.get<double>());
    return {};
}

double json_to_double(const nlohmann::json& v) {
    const auto parsed = util::parse_decimal(json_to_decimal_string(v));
    return parsed.value_or(0.0);
}

// Venue error text: {"status":"err","response":"..."} or a bare body.
std::string error_text(const nlohmann::json& response, const std::string& raw) {
    if (response.is_object() && response.contains("response") && response["response"].is_string()) {
        return response["response"].get<std::string>();
    }
    return raw;
}

bool is_ok(const nlohmann::json& response) {
    return response.is_object() && response.contains("status") && response["status"] == "ok";
}

} // namespace

HyperliquidAdapter::HyperliquidAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                                       HyperliquidSettings settings,
                                       bool is_mainnet,
                                       std::shared_ptr<auth::MonotonicClock> nonces,
                                       SignerFactory signer_factory)
    : http_(std::move(http)),
      settings_(std::move(settings)),
      is_mainnet_(is_mainnet),
      nonces_(std::move(nonces)),
      signer_factory_(std::move(signer_factory)) {
    if (!signer_factory_) {
        signer_factory_ = [](const std::string& key) {
            return std::make_unique<hyperliquid::HyperliquidSigner>(key);
        };
    }
}

nlohmann::ordered_json HyperliquidAdapter::build_exchange_request(const nlohmann::ordered_json& action,
                                                                  std::uint64_t nonce,
                                                                  const hyperliquid::HlSignature& sig,
                                                                  const std::optional<std::string>& vault_address) {
    nlohmann::ordered_json body;
    body["action"] = action;
    body["nonce"] = nonce;
    body["signature"] = {{"r", sig.r}, {"s", sig.s}, {"v", sig.v}};
    if (vault_address) {
        body["vaultAddress"] = util::to_lower_ascii(*vault_address);
    } else {
        body["vaultAddress"] = nullptr;
    }
    return body;
}

nlohmann::json HyperliquidAdapter::submit_action(const nlohmann::ordered_json& action,
                                                 const hyperliquid::IHyperliquidSigner& signer,
                                                 const std::optional<std::string>& vault_address,
                                                 ExecutionContext& ctx,
                                                 const char* label,
                                                 SubmissionTracker* tracker) const {
    // Fresh nonce per signed action; never reused across attempts.
    const std::uint64_t nonce = nonces_->next();
    const auto sig = signer.sign_l1_action(action, vault_address, nonce, is_mainnet_);
    if (tracker) tracker->advance(SubmissionState::Signed);

    const std::string body = build_exchange_request(action, nonce, sig, vault_address).dump();
    ctx.record_request(label, body);
    std::string raw;
    try {
        raw = http_->post_json(settings_.rest_url + "/exchange", body);
    } catch (const ExecutionError&) {
        if (tracker) tracker->advance(SubmissionState::Failed);
        throw;
    }
    ctx.record_response(label, raw);

    auto response = nlohmann::json::parse(raw, nullptr, false);
    if (response.is_discarded()) {
        if (tracker) tracker->advance(SubmissionState::Failed);
        throw VenueRejection(std::string("malformed Hyperliquid response to ") + label, {}, raw);
    }
    return response;
}

void HyperliquidAdapter::update_leverage(int asset, double leverage,
                                         const hyperliquid::IHyperliquidSigner& signer,
                                         const std::optional<std::string>& vault_address,
                                         ExecutionContext& ctx) const {
    const int lev = static_cast<int>(std::lround(leverage));
    const auto response = submit_action(hyperliquid::update_leverage_action(asset, lev),
                                        signer, vault_address, ctx, "updateLeverage", nullptr);
    if (is_ok(response)) {
        spdlog::info("[HyperliquidAdapter] Leverage set to {}x for asset {}", lev, asset);
    } else {
        ctx.warn("leverage not applied: " + error_text(response, response.dump()));
    }
}

VenueFill HyperliquidAdapter::execute(const TradeIntent& intent, ExecutionContext& ctx) {
    ctx.enter(Stage::Prepare);
    const auto* creds = std::get_if<auth::WalletCredentials>(&intent.credentials);
    if (!creds) throw InputError("Hyperliquid requires wallet credentials");
    const auto amount = util::parse_decimal(intent.amount);
    if (!amount || *amount <= 0.0) throw InputError("invalid amount: " + intent.amount);

    // Key decoding happens before any network call.
    const auto signer = signer_factory_(creds->private_key);
    const std::optional<std::string> vault = creds->vault_address;
    hyperliquid::validate_vault_address(vault);
    const std::string wallet = creds->wallet_address.value_or(signer->address());
    spdlog::info("[HyperliquidAdapter] Wallet: {}", utils::redact(wallet));
    if (creds->wallet_address &&
        util::to_lower_hex_address(*creds->wallet_address) != signer->address()) {
        spdlog::info("[HyperliquidAdapter] Signing as agent {} for {}",
                     utils::redact(signer->address()), utils::redact(wallet));
    }

    ctx.enter(Stage::Resolve);
    HyperliquidAssetResolver resolver(http_, settings_.rest_url, &ctx);
    const auto asset = resolver.resolve_perp(intent.symbol);
    spdlog::info("[HyperliquidAdapter] {} -> asset {} ({}, szDecimals={})",
                 intent.symbol, asset.asset, asset.coin, asset.sz_decimals);

    if (intent.leverage && *intent.leverage > 1.0) {
        update_leverage(asset.asset, *intent.leverage, *signer, vault, ctx);
    }

    ctx.enter(Stage::Quote);
    const bool is_buy = intent.side == Side::Buy;
    double price = 0.0;
    if (intent.price && *intent.price > 0.0) {
        price = *intent.price;
    } else {
        const double mid = resolver.mid_price(asset.coin);
        price = hyperliquid::aggressive_price(mid, is_buy);
        spdlog::info("[HyperliquidAdapter] Mid Price: {}, Using: {}", mid, price);
    }

    ctx.enter(Stage::Build);
    SubmissionTracker tracker;
    const std::string px = hyperliquid::float_to_wire(hyperliquid::round_price(price, asset.sz_decimals));
    const double size = hyperliquid::round_size(*amount, asset.sz_decimals);
    if (size <= 0.0) throw InputError("amount rounds to zero at szDecimals=" + std::to_string(asset.sz_decimals));
    const std::string sz = hyperliquid::float_to_wire(size);
    const bool reduce_only = intent.reduce_only || intent.action == IntentAction::Close;
    const auto action = hyperliquid::order_action(asset.asset, is_buy, px, sz, reduce_only);

    ctx.enter(Stage::Sign);
    ctx.enter(Stage::Submit);
    spdlog::info("[HyperliquidAdapter] {} {} {} @ {} (IOC{})", is_buy ? "BUY" : "SELL", sz, asset.coin, px,
                 reduce_only ? ", reduce-only" : "");
    const auto response = submit_action(action, *signer, vault, ctx, "order", &tracker);

    if (!is_ok(response)) {
        tracker.advance(SubmissionState::Failed);
        const std::string text = error_text(response, ctx.last_response());
        spdlog::error("[HyperliquidAdapter] Hyperliquid Error: {}", text);
        throw VenueRejection(text, {}, ctx.last_response());
    }
    tracker.advance(SubmissionState::Broadcast);
    tracker.advance(SubmissionState::Pending);

    ctx.enter(Stage::Confirm);
    VenueFill fill;
    fill.status = ExecutionStatus::Submitted;
    fill.correlation_id = intent.id;
    fill.message = "order acknowledged";
    nlohmann::json statuses = nlohmann::json::array();
    if (response.contains("response") && response["response"].is_object()) {
        const auto& data = response["response"].value("data", nlohmann::json::object());
        if (data.contains("statuses") && data["statuses"].is_array()) statuses = data["statuses"];
    }
    fill.venue_statuses = statuses.dump();

    bool have_fill_info = false;
    for (const auto& st : statuses) {
        if (!st.is_object()) continue;
        if (st.contains("error")) {
            ctx.warn("order status error: " + json_to_decimal_string(st["error"]));
            continue;
        }
        if (have_fill_info) continue;
        if (st.contains("filled") && st["filled"].is_object()) {
            const auto& f = st["filled"];
            fill.status = ExecutionStatus::Filled;
            if (f.contains("oid")) fill.order_id = json_to_decimal_string(f["oid"]);
            if (f.contains("totalSz")) fill.executed_amount = json_to_double(f["totalSz"]);
            if (f.contains("avgPx")) fill.executed_price = json_to_double(f["avgPx"]);
            fill.message = "order filled";
            have_fill_info = true;
        } else if (st.contains("resting") && st["resting"].is_object()) {
            const auto& r = st["resting"];
            if (r.contains("oid")) fill.order_id = json_to_decimal_string(r["oid"]);
            fill.message = "order resting";
            have_fill_info = true;
        }
    }
    if (!have_fill_info && !ctx.warnings().empty()) {
        fill.message = ctx.warnings().back();
    }
    tracker.advance(SubmissionState::Confirmed);
    spdlog::info("[HyperliquidAdapter] Statuses: {}", fill.venue_statuses);
    return fill;
}

} // namespace tradegate
