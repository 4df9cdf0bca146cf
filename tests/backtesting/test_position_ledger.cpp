#include <gtest/gtest.h>
#include "mock_components.hpp"
#include "optsim/backtest/position_ledger.hpp"
#include "optsim/core/error_reporter.hpp"
#include "optsim/core/time_utils.hpp"

using namespace optsim;
using namespace optsim::backtest;
using optsim::testing::make_quote;
using optsim::testing::make_signal;
using optsim::testing::make_snapshot;
using optsim::testing::ScriptedStrategy;

class PositionLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.initial_capital = 100000.0;
        config.position_size_pct = 0.02;
        config.fill.commission_per_contract = 0.65;
        config.fill.slippage_pct = 0.01;
        ledger = std::make_unique<PositionLedger>(config, &reporter);

        day1 = core::make_date(2024, 1, 2);
        day2 = core::make_date(2024, 1, 3);
        expiry = core::make_date(2024, 2, 16);
        call = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.00);
    }

    PositionLedgerConfig config;
    ErrorReporter reporter;
    std::unique_ptr<PositionLedger> ledger;
    Timestamp day1, day2, expiry;
    OptionQuote call;
};

TEST_F(PositionLedgerTest, OpenPositionSizingAndCost) {
    auto result = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const Position& position = result.value();
    EXPECT_EQ(position.position_id, 1u);
    EXPECT_DOUBLE_EQ(position.entry_price, 2.02);
    EXPECT_EQ(position.contracts, 10);
    EXPECT_NEAR(position.cost_basis, 2026.50, 1e-9);
    EXPECT_DOUBLE_EQ(position.current_price, 2.02);
    EXPECT_FALSE(position.is_closed());

    EXPECT_NEAR(ledger->current_capital(), 100000.0 - 2026.50, 1e-9);
    EXPECT_EQ(ledger->open_position_count(), 1u);
    EXPECT_TRUE(ledger->check_capital_conservation().is_ok());
}

TEST_F(PositionLedgerTest, ClosePositionProceedsAndPnl) {
    auto opened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(opened.is_ok());

    OptionQuote later = call;
    later.last = 3.00;
    auto closed = ledger->close_position(opened.value().position_id, make_snapshot(day2, {later}),
                                         day2, "profit_target");
    ASSERT_TRUE(closed.is_ok()) << closed.error()->what();

    const ClosedTrade& trade = closed.value();
    EXPECT_NEAR(trade.exit_price, 2.97, 1e-12);
    EXPECT_NEAR(trade.profit_loss, 937.00, 1e-6);
    EXPECT_NEAR(trade.profit_loss_pct, 937.0 / 2026.5 * 100.0, 1e-6);
    EXPECT_NEAR(trade.profit_loss_pct, 46.237, 1e-3);
    EXPECT_EQ(trade.exit_reason, "profit_target");
    EXPECT_EQ(trade.exit_date, day2);
    EXPECT_EQ(trade.holding_days(), 1);

    EXPECT_NEAR(ledger->current_capital(), 100000.0 + 937.0, 1e-6);
    EXPECT_NEAR(ledger->realized_pnl(), 937.0, 1e-6);
    EXPECT_EQ(ledger->open_position_count(), 0u);
    ASSERT_EQ(ledger->closed_trades().size(), 1u);
    EXPECT_TRUE(ledger->check_capital_conservation().is_ok());
}

TEST_F(PositionLedgerTest, PutFillsUseMirroredSlippage) {
    OptionQuote put = make_quote("SPY", OptionType::PUT, 470.0, expiry, 2.00);
    auto opened = ledger->open_position(make_signal(put), day1);
    ASSERT_TRUE(opened.is_ok());
    EXPECT_DOUBLE_EQ(opened.value().entry_price, 1.98);

    OptionQuote later = put;
    later.last = 1.00;
    auto closed = ledger->close_position(opened.value().position_id, make_snapshot(day2, {later}),
                                         day2, "stop_loss");
    ASSERT_TRUE(closed.is_ok());
    EXPECT_NEAR(closed.value().exit_price, 1.01, 1e-12);
    EXPECT_LT(closed.value().profit_loss, 0.0);
}

TEST_F(PositionLedgerTest, RejectsMalformedSignals) {
    Signal no_symbol = make_signal(call);
    no_symbol.symbol.clear();
    auto r1 = ledger->open_position(no_symbol, day1);
    ASSERT_TRUE(r1.is_error());
    EXPECT_EQ(r1.error()->code(), ErrorCode::INVALID_SIGNAL);

    Signal zero_price = make_signal(call);
    zero_price.price = 0.0;
    auto r2 = ledger->open_position(zero_price, day1);
    ASSERT_TRUE(r2.is_error());
    EXPECT_EQ(r2.error()->code(), ErrorCode::INVALID_SIGNAL);

    Signal negative_strike = make_signal(call);
    negative_strike.strike = -5.0;
    EXPECT_TRUE(ledger->open_position(negative_strike, day1).is_error());

    EXPECT_DOUBLE_EQ(ledger->current_capital(), 100000.0);
    EXPECT_EQ(ledger->open_position_count(), 0u);
}

TEST_F(PositionLedgerTest, RejectsWhenBudgetBuysNothing) {
    // Budget 2000 cannot buy one contract at 25.00 (2500 per contract)
    OptionQuote pricey = make_quote("SPY", OptionType::CALL, 400.0, expiry, 25.00);
    auto result = ledger->open_position(make_signal(pricey), day1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(ledger->current_capital(), 100000.0);
}

TEST_F(PositionLedgerTest, ShrinksOrderToAffordableCount) {
    PositionLedgerConfig all_in = config;
    all_in.initial_capital = 1000.0;
    all_in.position_size_pct = 1.0;
    PositionLedger small(all_in);

    // floor(1000 / 200) = 5 contracts, but 5 x 202.65 = 1013.25 > 1000
    auto result = small.open_position(make_signal(call), day1);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().contracts, 4);
    EXPECT_NEAR(result.value().cost_basis, 4 * 202.65, 1e-9);
    EXPECT_GE(small.current_capital(), 0.0);
    EXPECT_TRUE(small.check_capital_conservation().is_ok());
}

TEST_F(PositionLedgerTest, StalePriceWhenQuoteMissing) {
    auto opened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(opened.is_ok());

    MarketSnapshot empty = make_snapshot(day2, {});
    auto closed = ledger->close_position(opened.value().position_id, empty, day2,
                                         "end_of_backtest");
    ASSERT_TRUE(closed.is_ok());

    // Last known price 2.02, sold with slippage
    EXPECT_NEAR(closed.value().exit_price, 2.02 * 0.99, 1e-12);
    EXPECT_EQ(reporter.count(BacktestErrorKind::MISSING_MARKET_QUOTE), 1u);
    EXPECT_TRUE(ledger->check_capital_conservation().is_ok());
}

TEST_F(PositionLedgerTest, StalePriceWhenMarkNotPositive) {
    auto opened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(opened.is_ok());

    OptionQuote dead = call;
    dead.last = 0.0;
    dead.bid = 0.0;
    dead.ask = 0.0;
    auto closed = ledger->close_position(opened.value().position_id, make_snapshot(day2, {dead}),
                                         day2, "end_of_backtest");
    ASSERT_TRUE(closed.is_ok());
    EXPECT_NEAR(closed.value().exit_price, 2.02 * 0.99, 1e-12);
    EXPECT_EQ(reporter.count(BacktestErrorKind::MISSING_MARKET_QUOTE), 1u);
}

TEST_F(PositionLedgerTest, CloseUnknownPosition) {
    auto result = ledger->close_position(42, make_snapshot(day1, {call}), day1, "manual");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_NOT_FOUND);
}

TEST_F(PositionLedgerTest, EvaluateExitsUsesStrategyReason) {
    auto opened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(opened.is_ok());

    ScriptedStrategy strategy;
    strategy.exit_on(opened.value().position_id, day2, "profit_target");

    OptionQuote later = call;
    later.last = 2.50;
    auto closed = ledger->evaluate_exits(make_snapshot(day2, {later}), day2, strategy);
    ASSERT_TRUE(closed.is_ok());
    ASSERT_EQ(closed.value().size(), 1u);
    EXPECT_EQ(closed.value()[0].exit_reason, "profit_target");
    EXPECT_NEAR(closed.value()[0].exit_price, 2.50 * 0.99, 1e-12);
}

TEST_F(PositionLedgerTest, EvaluateExitsClosesExpiredPositions) {
    OptionQuote short_dated = make_quote("SPY", OptionType::CALL, 480.0, day2, 2.00);
    auto opened = ledger->open_position(make_signal(short_dated), day1);
    ASSERT_TRUE(opened.is_ok());

    ScriptedStrategy strategy;
    OptionQuote at_expiry = short_dated;
    at_expiry.last = 0.40;

    auto on_day1 = ledger->evaluate_exits(make_snapshot(day1, {short_dated}), day1, strategy);
    ASSERT_TRUE(on_day1.is_ok());
    EXPECT_TRUE(on_day1.value().empty());

    auto on_day2 = ledger->evaluate_exits(make_snapshot(day2, {at_expiry}), day2, strategy);
    ASSERT_TRUE(on_day2.is_ok());
    ASSERT_EQ(on_day2.value().size(), 1u);
    EXPECT_EQ(on_day2.value()[0].exit_reason, "expiration");
    EXPECT_EQ(strategy.exit_checks.size(), 2u);
}

TEST_F(PositionLedgerTest, MissingQuoteCarriesPositionForward) {
    OptionQuote short_dated = make_quote("SPY", OptionType::CALL, 480.0, day1, 2.00);
    auto opened = ledger->open_position(make_signal(short_dated), day1);
    ASSERT_TRUE(opened.is_ok());

    // Past expiration but unquoted: no implicit close
    ScriptedStrategy strategy;
    auto closed = ledger->evaluate_exits(make_snapshot(day2, {}), day2, strategy);
    ASSERT_TRUE(closed.is_ok());
    EXPECT_TRUE(closed.value().empty());
    EXPECT_EQ(ledger->open_position_count(), 1u);
    EXPECT_TRUE(strategy.exit_checks.empty());
    EXPECT_DOUBLE_EQ(ledger->open_positions()[0].current_price, 2.02);
    EXPECT_EQ(reporter.count(BacktestErrorKind::MISSING_MARKET_QUOTE), 1u);
}

TEST_F(PositionLedgerTest, StrategyErrorPropagates) {
    class FailingExit : public ScriptedStrategy {
    public:
        Result<std::optional<std::string>> check_exit_criteria(const Position&,
                                                               const OptionQuote&,
                                                               const Timestamp&) override {
            return make_error<std::optional<std::string>>(ErrorCode::STRATEGY_ERROR, "boom",
                                                          "FailingExit");
        }
    };

    ASSERT_TRUE(ledger->open_position(make_signal(call), day1).is_ok());
    FailingExit strategy;
    auto result = ledger->evaluate_exits(make_snapshot(day2, {call}), day2, strategy);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::STRATEGY_ERROR);
    EXPECT_EQ(ledger->open_position_count(), 1u);
}

TEST_F(PositionLedgerTest, MarkToMarketAndEquityPoint) {
    auto opened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(opened.is_ok());

    OptionQuote later = call;
    later.last = 2.50;
    ledger->mark_to_market(make_snapshot(day2, {later}), day2);

    EXPECT_DOUBLE_EQ(ledger->positions_value(), 2.50 * 100 * 10);
    EquityPoint point = ledger->equity_point(day2);
    EXPECT_EQ(point.date, day2);
    EXPECT_NEAR(point.cash, 100000.0 - 2026.5, 1e-9);
    EXPECT_NEAR(point.total_equity, point.cash + 2500.0, 1e-9);
    ASSERT_TRUE(ledger->open_positions()[0].last_mark_date.has_value());
    EXPECT_EQ(*ledger->open_positions()[0].last_mark_date, day2);
}

TEST_F(PositionLedgerTest, ConservationHoldsThroughManyTrades) {
    ScriptedStrategy strategy;
    Timestamp date = day1;
    for (int i = 0; i < 20; ++i) {
        OptionQuote quote = make_quote(i % 2 ? "QQQ" : "SPY",
                                       i % 3 ? OptionType::CALL : OptionType::PUT,
                                       400.0 + i, expiry, 1.0 + 0.37 * i);
        auto opened = ledger->open_position(make_signal(quote), date);
        ASSERT_TRUE(opened.is_ok());
        ASSERT_TRUE(ledger->check_capital_conservation().is_ok());

        quote.last = quote.last * (i % 2 ? 1.4 : 0.6);
        date = core::add_days(date, 1);
        auto closed = ledger->close_all(make_snapshot(date, {quote}), date, "test");
        ASSERT_TRUE(closed.is_ok());
        ASSERT_TRUE(ledger->check_capital_conservation().is_ok())
            << "drift " << ledger->capital_drift();
        EXPECT_GE(ledger->current_capital(), 0.0);
    }
    EXPECT_EQ(ledger->closed_trades().size(), 20u);
}

TEST_F(PositionLedgerTest, ResetRestoresInitialState) {
    ASSERT_TRUE(ledger->open_position(make_signal(call), day1).is_ok());
    ledger->reset();
    EXPECT_DOUBLE_EQ(ledger->current_capital(), 100000.0);
    EXPECT_EQ(ledger->open_position_count(), 0u);
    EXPECT_TRUE(ledger->closed_trades().empty());

    auto reopened = ledger->open_position(make_signal(call), day1);
    ASSERT_TRUE(reopened.is_ok());
    EXPECT_EQ(reopened.value().position_id, 1u);
}
