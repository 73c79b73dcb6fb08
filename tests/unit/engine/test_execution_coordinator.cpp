/**
 * @file test_execution_coordinator.cpp
 * @brief Result shaping, ledger recording and validation at the engine boundary
 */

#include <gtest/gtest.h>
#include "core/errors.h"
#include "engine/execution_coordinator.h"
#include "engine/ledger_sink.h"

#include <functional>
#include <memory>
#include <stdexcept>

using namespace tradegate;

namespace {

class FakeAdapter final : public IVenueAdapter {
public:
    using Behaviour = std::function<VenueFill(const TradeIntent&, ExecutionContext&)>;

    FakeAdapter(Venue venue, Behaviour behaviour, int* calls)
        : venue_(venue), behaviour_(std::move(behaviour)), calls_(calls) {}

    Venue venue() const override { return venue_; }
    VenueFill execute(const TradeIntent& intent, ExecutionContext& ctx) override {
        ++*calls_;
        return behaviour_(intent, ctx);
    }

private:
    Venue venue_;
    Behaviour behaviour_;
    int* calls_;
};

TradeIntent bybit_intent() {
    TradeIntent intent;
    intent.id = "tg-test-1";
    intent.venue = Venue::Bybit;
    intent.symbol = "BTCUSDT";
    intent.side = Side::Buy;
    intent.amount = "0.01";
    intent.credentials = auth::ApiKeyCredentials{"key", "secret"};
    return intent;
}

TradeIntent solana_intent() {
    TradeIntent intent = bybit_intent();
    intent.venue = Venue::Solana;
    intent.symbol = "So11111111111111111111111111111111111111112";
    intent.credentials = auth::WalletCredentials{"seed", std::nullopt, std::nullopt};
    return intent;
}

class CoordinatorTest : public ::testing::Test {
protected:
    ExecutionCoordinator make(Venue venue, FakeAdapter::Behaviour behaviour) {
        VenueRouter router;
        router.register_adapter(std::make_unique<FakeAdapter>(venue, std::move(behaviour), &adapter_calls));
        return ExecutionCoordinator(std::move(router), sink);
    }

    std::shared_ptr<MemoryLedgerSink> sink = std::make_shared<MemoryLedgerSink>();
    int adapter_calls{0};
};

} // namespace

// ============================================================================
// TESTS: SUCCESS PATHS
// ============================================================================

TEST_F(CoordinatorTest, FillIsCopiedAndRecordedOnce) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent& intent, ExecutionContext& ctx) {
        ctx.enter(Stage::Submit);
        ctx.warn("leverage unchanged");
        VenueFill fill;
        fill.status = ExecutionStatus::Submitted;
        fill.order_id = "1321003749386327552";
        fill.correlation_id = intent.id;
        fill.venue_statuses = R"({"retCode":0})";
        return fill;
    });

    const auto result = coordinator.execute(bybit_intent());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::Submitted);
    EXPECT_EQ(*result.order_id, "1321003749386327552");
    EXPECT_EQ(result.reason_code, "ok");
    EXPECT_EQ(result.stage, "done");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_TRUE(result.execution_time_ms.has_value());
    EXPECT_GT(result.timestamp_ms, 0);

    ASSERT_EQ(sink->append_calls(), 1u);
    EXPECT_EQ(sink->results()[0].intent_id, "tg-test-1");
}

TEST_F(CoordinatorTest, NoPositionIsSuccess) {
    auto coordinator = make(Venue::Solana, [](const TradeIntent&, ExecutionContext&) {
        VenueFill fill;
        fill.status = ExecutionStatus::NoPosition;
        fill.message = "no position to close";
        return fill;
    });
    auto intent = solana_intent();
    intent.action = IntentAction::Close;
    intent.amount.clear();

    const auto result = coordinator.execute(intent);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::NoPosition);
    EXPECT_EQ(result.message, "no position to close");
}

// ============================================================================
// TESTS: FAILURE SHAPING
// ============================================================================

TEST_F(CoordinatorTest, VenueRejectionKeepsCodeAndRawResponse) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext& ctx) -> VenueFill {
        ctx.enter(Stage::Submit);
        throw VenueRejection("insufficient balance", "110007", R"({"retCode":110007})");
    });

    const auto result = coordinator.execute(bybit_intent());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::Rejected);
    EXPECT_EQ(result.reason_code, "insufficient_balance");
    EXPECT_EQ(result.venue_code, "110007");
    EXPECT_EQ(result.venue_statuses, R"({"retCode":110007})");
    EXPECT_EQ(result.stage, "submit");
    EXPECT_FALSE(result.retryable);
    EXPECT_EQ(sink->append_calls(), 1u);
}

TEST_F(CoordinatorTest, TransportFailureIsRetryable) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext&) -> VenueFill {
        throw TransportError("connection refused");
    });
    const auto result = coordinator.execute(bybit_intent());
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    EXPECT_EQ(result.reason_code, "network_error");
    EXPECT_TRUE(result.retryable);
}

TEST_F(CoordinatorTest, SettlementTimeoutIsUnknownWithSignature) {
    auto coordinator = make(Venue::Solana, [](const TradeIntent&, ExecutionContext& ctx) -> VenueFill {
        ctx.enter(Stage::Confirm);
        ctx.set_reference("5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW");
        throw SettlementTimeout("confirmation timed out");
    });

    const auto result = coordinator.execute(solana_intent());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::Unknown);
    EXPECT_EQ(result.reason_code, "unknown_outcome");
    ASSERT_TRUE(result.tx_hash.has_value());
    EXPECT_EQ(result.tx_hash->substr(0, 6), "5VERv8");
    EXPECT_TRUE(result.retryable);
    EXPECT_EQ(result.stage, "confirm");
}

TEST_F(CoordinatorTest, UnexpectedExceptionIsInternal) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext&) -> VenueFill {
        throw std::out_of_range("map::at");
    });
    const auto result = coordinator.execute(bybit_intent());
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    EXPECT_EQ(result.reason_code, "internal_error");
    EXPECT_EQ(*result.error, "map::at");
    EXPECT_EQ(sink->append_calls(), 1u);
}

TEST_F(CoordinatorTest, FailingLedgerDoesNotChangeResult) {
    sink->set_fail_appends(true);
    sink->set_fail_traces(true);
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext& ctx) {
        ctx.record_request("order", "{}");
        VenueFill fill;
        fill.status = ExecutionStatus::Submitted;
        fill.order_id = "42";
        return fill;
    });

    const auto result = coordinator.execute(bybit_intent());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(*result.order_id, "42");
    EXPECT_EQ(sink->append_calls(), 1u);
    EXPECT_TRUE(sink->results().empty());
}

// ============================================================================
// TESTS: VALIDATION
// ============================================================================

TEST_F(CoordinatorTest, InvalidIntentsNeverReachTheAdapter) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext&) { return VenueFill{}; });

    std::vector<TradeIntent> bad(6, bybit_intent());
    bad[0].symbol = "  ";
    bad[1].amount = "0";
    bad[2].amount = "abc";
    bad[3].leverage = 0.5;
    bad[4].price = -1.0;
    bad[5].credentials = auth::WalletCredentials{"0xabc", std::nullopt, std::nullopt};

    for (const auto& intent : bad) {
        const auto result = coordinator.execute(intent);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.status, ExecutionStatus::Rejected);
        EXPECT_EQ(result.reason_code, "invalid_params");
        EXPECT_EQ(result.stage, "validate");
    }
    EXPECT_EQ(adapter_calls, 0);
    EXPECT_EQ(sink->append_calls(), bad.size());
}

TEST_F(CoordinatorTest, UnregisteredVenueIsRejected) {
    auto coordinator = make(Venue::Bybit, [](const TradeIntent&, ExecutionContext&) { return VenueFill{}; });
    EXPECT_THROW(coordinator.validate(solana_intent()), InputError);
}

TEST_F(CoordinatorTest, CloseNeedsNoAmount) {
    auto coordinator = make(Venue::Solana, [](const TradeIntent&, ExecutionContext&) { return VenueFill{}; });
    auto intent = solana_intent();
    intent.action = IntentAction::Close;
    intent.amount.clear();
    EXPECT_NO_THROW(coordinator.validate(intent));
}
