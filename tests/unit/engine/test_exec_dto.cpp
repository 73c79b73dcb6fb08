/**
 * @file test_exec_dto.cpp
 * @brief Intent document parsing and result serialization
 */

#include <gtest/gtest.h>
#include "core/errors.h"
#include "engine/exec_dto.h"
#include "engine/order_serializer.h"

#include <rapidjson/document.h>

using namespace tradegate;

// ============================================================================
// TESTS: INTENT PARSING
// ============================================================================

TEST(IntentJson, ParsesFullDocument) {
    const auto req = parse_trade_intent_json(R"({
        "id": "intent-7",
        "venue": "solana",
        "symbol": "DezXAZ8z7PnrnRJjz3wXBoRgixCa6xjnB7YaB1pPB263",
        "side": "SELL",
        "amount": 125.5,
        "action": "close",
        "constraints": {"max_slippage_bps": "75", "time_limit_ms": 30000, "min_liquidity": 10000},
        "credentials": {"private_key": "abc", "wallet_address": "w"}
    })");

    const auto& intent = req.intent;
    EXPECT_EQ(intent.id, "intent-7");
    EXPECT_EQ(intent.venue, Venue::Solana);
    EXPECT_EQ(intent.side, Side::Sell);
    EXPECT_EQ(intent.amount, "125.5");
    EXPECT_EQ(intent.action, IntentAction::Close);
    EXPECT_EQ(*intent.constraints.max_slippage_bps, 75);
    EXPECT_EQ(intent.constraints.time_limit->count(), 30000);
    EXPECT_DOUBLE_EQ(*intent.constraints.min_liquidity, 10000.0);
    EXPECT_EQ(req.credentials.private_key, "abc");
    EXPECT_EQ(req.credentials.wallet_address, "w");
    EXPECT_TRUE(req.credentials.api_key.empty());
}

TEST(IntentJson, DefaultsAndGeneratedId) {
    const auto req = parse_trade_intent_json(R"({"venue":"bybit","symbol":"ETHUSDT","amount":"0.5","leverage":3})");
    EXPECT_EQ(req.intent.id.rfind("tg-", 0), 0u);
    EXPECT_EQ(req.intent.side, Side::Buy);
    EXPECT_EQ(req.intent.action, IntentAction::Open);
    EXPECT_FALSE(req.intent.reduce_only);
    EXPECT_DOUBLE_EQ(*req.intent.leverage, 3.0);
    EXPECT_FALSE(req.intent.price.has_value());
}

TEST(IntentJson, RejectsMalformedDocuments) {
    EXPECT_THROW(parse_trade_intent_json("{"), InputError);
    EXPECT_THROW(parse_trade_intent_json("[]"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"symbol":"BTC"})"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"venue":"kraken"})"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"venue":"bybit","side":"hold"})"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"venue":"bybit","action":"flip"})"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"venue":"bybit","amount":true})"), InputError);
    EXPECT_THROW(parse_trade_intent_json(R"({"venue":"bybit","constraints":{"time_limit_ms":0}})"), InputError);
}

// ============================================================================
// TESTS: RESULT SERIALIZATION
// ============================================================================

TEST(ResultJson, SuccessOmitsUnsetFields) {
    ExecutionResult result;
    result.intent_id = "intent-7";
    result.success = true;
    result.status = ExecutionStatus::Filled;
    result.venue = Venue::Hyperliquid;
    result.symbol = "ETH";
    result.executed_amount = 0.02;
    result.executed_price = 1986.0;
    result.venue_statuses = R"([{"filled":{"oid":77}}])";
    result.timestamp_ms = 1700000000000;

    rapidjson::Document doc;
    doc.Parse(engine::serialize_execution_result(result).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["status"].GetString(), "filled");
    EXPECT_STREQ(doc["venue"].GetString(), "hyperliquid");
    EXPECT_TRUE(doc["success"].GetBool());
    EXPECT_DOUBLE_EQ(doc["executedPrice"].GetDouble(), 1986.0);
    EXPECT_STREQ(doc["reasonCode"].GetString(), "ok");
    EXPECT_FALSE(doc.HasMember("txHash"));
    EXPECT_FALSE(doc.HasMember("error"));
    EXPECT_FALSE(doc.HasMember("warnings"));
    ASSERT_TRUE(doc["venueStatuses"].IsArray());
    EXPECT_EQ(doc["venueStatuses"][0]["filled"]["oid"].GetInt(), 77);
}

TEST(ResultJson, FailureCarriesReasonAndRawText) {
    ExecutionResult result;
    result.intent_id = "intent-8";
    result.status = ExecutionStatus::Unknown;
    result.venue = Venue::Solana;
    result.tx_hash = "sig";
    result.error = "confirmation timed out";
    result.reason_code = "unknown_outcome";
    result.retryable = true;
    result.stage = "confirm";
    result.warnings = {"decimals unavailable"};
    result.venue_statuses = "<html>bad gateway</html>";

    rapidjson::Document doc;
    doc.Parse(engine::serialize_execution_result(result).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_FALSE(doc["success"].GetBool());
    EXPECT_STREQ(doc["status"].GetString(), "unknown");
    EXPECT_STREQ(doc["txHash"].GetString(), "sig");
    EXPECT_TRUE(doc["retryable"].GetBool());
    EXPECT_STREQ(doc["stage"].GetString(), "confirm");
    EXPECT_EQ(doc["warnings"].Size(), 1u);
    EXPECT_STREQ(doc["venueStatuses"].GetString(), "<html>bad gateway</html>");
}
