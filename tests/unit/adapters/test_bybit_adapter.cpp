/**
 * @file test_bybit_adapter.cpp
 * @brief Bybit v5 adapter against a scripted transport
 */

#include <gtest/gtest.h>
#include "adapters/bybit/bybit_adapter.h"
#include "core/errors.h"
#include "engine/ledger_sink.h"
#include "support/scripted_http_client.h"

using namespace tradegate;
using tradegate::testing::ScriptedHttpClient;

namespace {

TradeIntent bybit_intent() {
    TradeIntent intent;
    intent.id = "tg-test-0001";
    intent.venue = Venue::Bybit;
    intent.symbol = "ETH/USDT";
    intent.side = Side::Buy;
    intent.amount = "0.5";
    intent.credentials = auth::ApiKeyCredentials{"key123", "secret456"};
    return intent;
}

class BybitAdapterTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedHttpClient> http = std::make_shared<ScriptedHttpClient>();
    MemoryLedgerSink sink;
    // Stalled wall clock: increasing stamps must come from the clock itself.
    std::shared_ptr<auth::MonotonicClock> clock =
        std::make_shared<auth::MonotonicClock>([] { return std::uint64_t{1700000000000}; });
    BybitAdapter adapter{http, BybitSettings{}, clock};
};

} // namespace

// ============================================================================
// TESTS: REQUEST CONSTRUCTION
// ============================================================================

TEST_F(BybitAdapterTest, OrderBodyShape) {
    EXPECT_EQ(adapter.build_order_body("ETHUSDT", Side::Sell, "0.5", true, "cid-1"),
              R"({"category":"linear","symbol":"ETHUSDT","side":"Sell","orderType":"Market","qty":"0.5","reduceOnly":true,"orderLinkId":"cid-1"})");
    EXPECT_EQ(adapter.build_leverage_body("ETHUSDT", 5),
              R"({"category":"linear","symbol":"ETHUSDT","buyLeverage":"5","sellLeverage":"5"})");
}

// ============================================================================
// TESTS: EXECUTION
// ============================================================================

TEST_F(BybitAdapterTest, LeverageNotModifiedStillPlacesOrder) {
    http->on("/v5/position/set-leverage", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":110043,"retMsg":"leverage not modified","result":{}})"));
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{"orderId":"1321003749386327552","orderLinkId":"tg-test-0001"}})"));

    auto intent = bybit_intent();
    intent.leverage = 5.0;
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);

    EXPECT_EQ(fill.status, ExecutionStatus::Submitted);
    ASSERT_TRUE(fill.order_id);
    EXPECT_EQ(*fill.order_id, "1321003749386327552");
    EXPECT_EQ(fill.correlation_id, "tg-test-0001");
    EXPECT_DOUBLE_EQ(fill.executed_amount, 0.5);
    EXPECT_TRUE(ctx.warnings().empty());

    const auto calls = http->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_NE(calls[1].body.find(R"("symbol":"ETHUSDT")"), std::string::npos);
    EXPECT_NE(calls[1].body.find(R"("orderLinkId":"tg-test-0001")"), std::string::npos);

    // Two signed calls in one execution carry strictly increasing timestamps.
    const auto ts_leverage = std::stoull(calls[0].header("X-BAPI-TIMESTAMP"));
    const auto ts_order = std::stoull(calls[1].header("X-BAPI-TIMESTAMP"));
    EXPECT_LT(ts_leverage, ts_order);
    EXPECT_EQ(calls[1].header("X-BAPI-SIGN"),
              auth::hmac_sha256_hex("secret456", calls[1].header("X-BAPI-TIMESTAMP") + "key123" + "5000" + calls[1].body));
}

TEST_F(BybitAdapterTest, FreshLeverageThenMarketBuy) {
    http->on("/v5/position/set-leverage", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{}})"));
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{"orderId":"77","orderLinkId":"tg-test-0001"}})"));

    auto intent = bybit_intent();
    intent.symbol = "ETH";
    intent.amount = " 10 ";
    intent.leverage = 5.0;
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);

    ASSERT_TRUE(fill.order_id);
    EXPECT_EQ(*fill.order_id, "77");
    EXPECT_DOUBLE_EQ(fill.executed_amount, 10.0);
    EXPECT_TRUE(ctx.warnings().empty());

    const auto calls = http->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_NE(calls[0].url.find("/v5/position/set-leverage"), std::string::npos);
    EXPECT_NE(calls[0].body.find(R"("buyLeverage":"5")"), std::string::npos);
    EXPECT_NE(calls[1].url.find("/v5/order/create"), std::string::npos);
    EXPECT_NE(calls[1].body.find(R"("side":"Buy","orderType":"Market","qty":"10")"), std::string::npos);
    EXPECT_LT(std::stoull(calls[0].header("X-BAPI-TIMESTAMP")), std::stoull(calls[1].header("X-BAPI-TIMESTAMP")));
}

TEST_F(BybitAdapterTest, LeverageFailureIsAWarning) {
    http->on("/v5/position/set-leverage", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":10001,"retMsg":"leverage invalid","result":{}})"));
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{"orderId":"42","orderLinkId":"tg-test-0001"}})"));

    auto intent = bybit_intent();
    intent.leverage = 200.0;
    ExecutionContext ctx(intent, &sink);
    const auto fill = adapter.execute(intent, ctx);
    EXPECT_EQ(*fill.order_id, "42");
    ASSERT_EQ(ctx.warnings().size(), 1u);
    EXPECT_NE(ctx.warnings()[0].find("10001"), std::string::npos);
}

TEST_F(BybitAdapterTest, NoLeverageCallAtOneX) {
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{"orderId":"7","orderLinkId":""}})"));
    auto intent = bybit_intent();
    intent.leverage = 1.0;
    ExecutionContext ctx(intent, &sink);
    adapter.execute(intent, ctx);
    EXPECT_EQ(http->count("/v5/position/set-leverage"), 0u);
}

TEST_F(BybitAdapterTest, RejectionCarriesRetCodeAndRawResponse) {
    const std::string raw = R"({"retCode":110007,"retMsg":"ab not enough for new order","result":{}})";
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(raw));

    const auto intent = bybit_intent();
    ExecutionContext ctx(intent, &sink);
    try {
        adapter.execute(intent, ctx);
        FAIL() << "expected VenueRejection";
    } catch (const VenueRejection& e) {
        EXPECT_EQ(e.venue_code(), "110007");
        EXPECT_EQ(e.raw_response(), raw);
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_EQ(ctx.stage(), Stage::Submit);
}

TEST_F(BybitAdapterTest, CloseIsRejectedBeforeAnyRequest) {
    auto intent = bybit_intent();
    intent.action = IntentAction::Close;
    ExecutionContext ctx(intent, &sink);
    EXPECT_THROW(adapter.execute(intent, ctx), InputError);
    EXPECT_TRUE(http->calls().empty());
}

TEST_F(BybitAdapterTest, RequestsAreTraced) {
    http->on("/v5/order/create", "", ScriptedHttpClient::Reply::ok(
        R"({"retCode":0,"retMsg":"OK","result":{"orderId":"9","orderLinkId":"tg-test-0001"}})"));
    const auto intent = bybit_intent();
    ExecutionContext ctx(intent, &sink);
    adapter.execute(intent, ctx);

    const auto traces = sink.traces();
    ASSERT_EQ(traces.size(), 2u);
    EXPECT_EQ(traces[0].label, "order request");
    EXPECT_EQ(traces[1].label, "order response");
    EXPECT_EQ(traces[0].payload.find("secret456"), std::string::npos);
}
