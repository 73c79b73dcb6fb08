/**
 * @file test_hyperliquid_adapter.cpp
 * @brief Hyperliquid asset resolution, wire helpers, L1 signing and order flow
 */

#include <gtest/gtest.h>
#include "adapters/hyperliquid/hyperliquid_adapter.h"
#include "adapters/hyperliquid/hyperliquid_asset_resolver.h"
#include "adapters/hyperliquid/hyperliquid_wire.h"
#include "core/errors.h"
#include "core/util/encoding.h"
#include "engine/ledger_sink.h"
#include "support/scripted_http_client.h"

#include <algorithm>

using namespace tradegate;
using tradegate::testing::ScriptedHttpClient;

namespace {

constexpr const char* kPrivateKey = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
constexpr const char* kMeta = R"({"universe":[{"name":"BTC","szDecimals":5},{"name":"ETH","szDecimals":4},{"name":"SOL","szDecimals":2}]})";
constexpr const char* kMids = R"({"BTC":"65000.5","ETH":"1891.4","SOL":"150.25"})";

TradeIntent hl_intent(const std::string& symbol) {
    TradeIntent intent;
    intent.id = "tg-hl-1";
    intent.venue = Venue::Hyperliquid;
    intent.symbol = symbol;
    intent.side = Side::Buy;
    intent.amount = "0.02";
    intent.credentials = auth::WalletCredentials{kPrivateKey, std::nullopt, std::nullopt};
    return intent;
}

template <typename Json>
crypto::RecoverableSignature to_recoverable(const Json& sig) {
    crypto::RecoverableSignature out;
    const auto r = util::hex_decode(sig["r"].template get<std::string>());
    const auto s = util::hex_decode(sig["s"].template get<std::string>());
    EXPECT_TRUE(r && r->size() == 32);
    EXPECT_TRUE(s && s->size() == 32);
    std::copy(r->begin(), r->end(), out.r.begin());
    std::copy(s->begin(), s->end(), out.s.begin());
    out.recovery_id = static_cast<std::uint8_t>(sig["v"].template get<int>() - 27);
    return out;
}

class HyperliquidAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        http->on("/info", "\"meta\"", ScriptedHttpClient::Reply::ok(kMeta), true);
        http->on("/info", "\"allMids\"", ScriptedHttpClient::Reply::ok(kMids), true);
    }

    std::shared_ptr<ScriptedHttpClient> http = std::make_shared<ScriptedHttpClient>();
    MemoryLedgerSink sink;
    std::shared_ptr<auth::MonotonicClock> nonces =
        std::make_shared<auth::MonotonicClock>([] { return std::uint64_t{1700000000000}; });
    HyperliquidAdapter adapter{http, HyperliquidSettings{"https://hl.test"}, true, nonces};
};

} // namespace

// ============================================================================
// TESTS: ASSET RESOLUTION
// ============================================================================

TEST_F(HyperliquidAdapterTest, SymbolSpellingsResolveToSameAsset) {
    HyperliquidAssetResolver resolver(http, "https://hl.test");
    const auto plain = resolver.resolve_perp("BTC");
    const auto slashed = resolver.resolve_perp("BTC/USDT");
    const auto compact = resolver.resolve_perp("BTCUSDT");
    EXPECT_EQ(plain.asset, 0);
    EXPECT_EQ(slashed.asset, plain.asset);
    EXPECT_EQ(compact.asset, plain.asset);
    EXPECT_EQ(resolver.resolve_perp("eth-perp").asset, 1);
    EXPECT_EQ(plain.sz_decimals, 5);
    // Universe is fetched once per resolver.
    EXPECT_EQ(http->count("/info", "\"meta\""), 1u);
}

TEST_F(HyperliquidAdapterTest, UnknownAssetIsResolutionError) {
    HyperliquidAssetResolver resolver(http, "https://hl.test");
    try {
        resolver.resolve_perp("DOGEUSDT");
        FAIL() << "expected ResolutionError";
    } catch (const ResolutionError& e) {
        EXPECT_EQ(std::string(e.what()), "asset not found: DOGEUSDT");
    }
}

TEST(HyperliquidWire, PriceAndSizeRounding) {
    EXPECT_EQ(hyperliquid::float_to_wire(1891.40000000), "1891.4");
    EXPECT_EQ(hyperliquid::float_to_wire(hyperliquid::round_price(1985.97, 4)), "1986");
    EXPECT_EQ(hyperliquid::float_to_wire(hyperliquid::round_price(0.0123456, 0)), "0.012346");
    EXPECT_DOUBLE_EQ(hyperliquid::round_size(0.123456, 4), 0.1235);
    EXPECT_DOUBLE_EQ(hyperliquid::aggressive_price(100.0, true), 105.0);
    EXPECT_DOUBLE_EQ(hyperliquid::aggressive_price(100.0, false), 95.0);
    EXPECT_THROW(hyperliquid::float_to_wire(0.123456789), InputError);
}

TEST(HyperliquidWire, OrderActionKeyOrder) {
    const auto action = hyperliquid::order_action(1, true, "1986", "0.02", false);
    EXPECT_EQ(action.dump(),
              R"({"type":"order","orders":[{"a":1,"b":true,"p":"1986","s":"0.02","r":false,"t":{"limit":{"tif":"Ioc"}}}],"grouping":"na"})");
}

// ============================================================================
// TESTS: SIGNING
// ============================================================================

TEST(HyperliquidSigner, SignatureRecoversToSignerAddress) {
    hyperliquid::HyperliquidSigner signer(kPrivateKey);
    const auto action = hyperliquid::order_action(0, false, "65000", "0.001", true);
    const std::uint64_t nonce = 1700000000123;

    for (bool mainnet : {true, false}) {
        const auto sig = signer.sign_l1_action(action, std::nullopt, nonce, mainnet);
        const auto digest = hyperliquid::l1_signing_digest(hyperliquid::action_hash(action, std::nullopt, nonce), mainnet);
        EXPECT_EQ(crypto::recover_eth_address(digest, to_recoverable(nlohmann::json{{"r", sig.r}, {"s", sig.s}, {"v", sig.v}})),
                  signer.address());
    }
}

TEST(HyperliquidSigner, VaultAndNonceChangeTheActionHash) {
    const auto action = hyperliquid::update_leverage_action(0, 10);
    const auto base = hyperliquid::action_hash(action, std::nullopt, 1);
    EXPECT_NE(base, hyperliquid::action_hash(action, std::nullopt, 2));
    EXPECT_NE(base, hyperliquid::action_hash(action, std::string("0x1111111111111111111111111111111111111111"), 1));
    EXPECT_THROW(hyperliquid::action_hash(action, std::string("0x12"), 1), InputError);
}

TEST(HyperliquidSigner, BadKeyTextIsInputError) {
    EXPECT_THROW(hyperliquid::HyperliquidSigner("not-a-key"), InputError);
}

// ============================================================================
// TESTS: ORDER FLOW
// ============================================================================

TEST_F(HyperliquidAdapterTest, FilledOrderCopiesFillInfoAndStatuses) {
    const std::string statuses = R"([{"filled":{"totalSz":"0.02","avgPx":"1891.4","oid":77738308}}])";
    http->on("/exchange", "\"type\":\"order\"", ScriptedHttpClient::Reply::ok(
        R"({"status":"ok","response":{"type":"order","data":{"statuses":)" + statuses + "}}}"));

    const auto intent = hl_intent("ETH/USDT");
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);

    EXPECT_EQ(fill.status, ExecutionStatus::Filled);
    ASSERT_TRUE(fill.order_id);
    EXPECT_EQ(*fill.order_id, "77738308");
    EXPECT_DOUBLE_EQ(fill.executed_amount, 0.02);
    EXPECT_DOUBLE_EQ(fill.executed_price, 1891.4);
    EXPECT_EQ(nlohmann::json::parse(fill.venue_statuses), nlohmann::json::parse(statuses));

    const auto calls = http->calls();
    const auto order_call = std::find_if(calls.begin(), calls.end(),
                                         [](const auto& c) { return c.url == "https://hl.test/exchange"; });
    ASSERT_NE(order_call, calls.end());
    const auto body = nlohmann::ordered_json::parse(order_call->body);
    const auto& order = body["action"]["orders"][0];
    EXPECT_EQ(order["a"], 1);
    EXPECT_EQ(order["b"], true);
    EXPECT_EQ(order["p"], "1986");
    EXPECT_EQ(order["s"], "0.02");
    EXPECT_TRUE(body["vaultAddress"].is_null());

    // The posted signature verifies against the posted action and nonce.
    const auto nonce = body["nonce"].get<std::uint64_t>();
    const auto digest = hyperliquid::l1_signing_digest(hyperliquid::action_hash(body["action"], std::nullopt, nonce), true);
    hyperliquid::HyperliquidSigner signer(kPrivateKey);
    EXPECT_EQ(crypto::recover_eth_address(digest, to_recoverable(body["signature"])), signer.address());
}

TEST_F(HyperliquidAdapterTest, LeverageUsesItsOwnNonce) {
    http->on("/exchange", "updateLeverage", ScriptedHttpClient::Reply::ok(R"({"status":"ok","response":{"type":"default"}})"));
    http->on("/exchange", "\"type\":\"order\"", ScriptedHttpClient::Reply::ok(
        R"({"status":"ok","response":{"type":"order","data":{"statuses":[{"resting":{"oid":5}}]}}})"));

    auto intent = hl_intent("SOL");
    intent.leverage = 3.0;
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);
    EXPECT_EQ(fill.status, ExecutionStatus::Submitted);
    EXPECT_EQ(*fill.order_id, "5");

    const auto calls = http->calls();
    std::vector<std::uint64_t> exchange_nonces;
    for (const auto& c : calls) {
        if (c.url.find("/exchange") == std::string::npos) continue;
        exchange_nonces.push_back(nlohmann::json::parse(c.body)["nonce"].get<std::uint64_t>());
    }
    ASSERT_EQ(exchange_nonces.size(), 2u);
    EXPECT_LT(exchange_nonces[0], exchange_nonces[1]);
}

TEST_F(HyperliquidAdapterTest, LeverageRejectionIsOnlyAWarning) {
    http->on("/exchange", "updateLeverage", ScriptedHttpClient::Reply::ok(R"({"status":"err","response":"Invalid leverage"})"));
    http->on("/exchange", "\"type\":\"order\"", ScriptedHttpClient::Reply::ok(
        R"({"status":"ok","response":{"type":"order","data":{"statuses":[{"resting":{"oid":6}}]}}})"));

    auto intent = hl_intent("SOL");
    intent.leverage = 100.0;
    ExecutionContext ctx(intent, &sink);
    EXPECT_NO_THROW(adapter.execute(intent, ctx));
    ASSERT_EQ(ctx.warnings().size(), 1u);
    EXPECT_NE(ctx.warnings()[0].find("Invalid leverage"), std::string::npos);
}

TEST_F(HyperliquidAdapterTest, ErrStatusIsVenueRejection) {
    const std::string raw = R"({"status":"err","response":"User or API Wallet does not exist."})";
    http->on("/exchange", "", ScriptedHttpClient::Reply::ok(raw));
    const auto intent = hl_intent("BTC");
    ExecutionContext ctx(intent, &sink);
    try {
        adapter.execute(intent, ctx);
        FAIL() << "expected VenueRejection";
    } catch (const VenueRejection& e) {
        EXPECT_EQ(std::string(e.what()), "User or API Wallet does not exist.");
        EXPECT_EQ(e.raw_response(), raw);
    }
}

TEST_F(HyperliquidAdapterTest, PerOrderErrorBecomesWarning) {
    http->on("/exchange", "", ScriptedHttpClient::Reply::ok(
        R"({"status":"ok","response":{"type":"order","data":{"statuses":[{"error":"Order could not immediately match against any resting orders."}]}}})"));
    const auto intent = hl_intent("BTC");
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);
    EXPECT_EQ(fill.status, ExecutionStatus::Submitted);
    EXPECT_FALSE(fill.order_id);
    ASSERT_EQ(ctx.warnings().size(), 1u);
    EXPECT_EQ(fill.message, ctx.warnings()[0]);
}

TEST_F(HyperliquidAdapterTest, CloseIsReduceOnlyAndExplicitPriceSkipsMids) {
    http->on("/exchange", "", ScriptedHttpClient::Reply::ok(
        R"({"status":"ok","response":{"type":"order","data":{"statuses":[{"filled":{"totalSz":"0.02","avgPx":"1900","oid":1}}]}}})"));
    auto intent = hl_intent("ETH");
    intent.action = IntentAction::Close;
    intent.side = Side::Sell;
    intent.price = 1900.0;
    ExecutionContext ctx(intent, &sink);
    adapter.execute(intent, ctx);

    EXPECT_EQ(http->count("/info", "allMids"), 0u);
    const auto calls = http->calls();
    const auto body = nlohmann::json::parse(calls.back().body);
    EXPECT_EQ(body["action"]["orders"][0]["r"], true);
    EXPECT_EQ(body["action"]["orders"][0]["p"], "1900");
}

TEST_F(HyperliquidAdapterTest, SizeRoundingToZeroFailsBeforeSubmit) {
    auto intent = hl_intent("SOL");
    intent.amount = "0.001";
    ExecutionContext ctx(intent, &sink);
    EXPECT_THROW(adapter.execute(intent, ctx), InputError);
    EXPECT_EQ(http->count("/exchange"), 0u);
}

TEST_F(HyperliquidAdapterTest, MalformedVaultFailsBeforeNetwork) {
    auto intent = hl_intent("ETH");
    intent.credentials = auth::WalletCredentials{kPrivateKey, std::nullopt, std::string("0x12")};
    ExecutionContext ctx(intent, &sink);
    try {
        adapter.execute(intent, ctx);
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_STREQ(e.what(), "invalid vault address");
    }
    EXPECT_EQ(ctx.stage(), Stage::Prepare);
    EXPECT_TRUE(http->calls().empty());
}
