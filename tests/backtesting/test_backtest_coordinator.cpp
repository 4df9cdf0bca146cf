#include <gtest/gtest.h>
#include <numeric>
#include "mock_components.hpp"
#include "optsim/backtest/backtest_coordinator.hpp"
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

using namespace optsim;
using namespace optsim::backtest;
using optsim::testing::make_quote;
using optsim::testing::make_signal;
using optsim::testing::MockMarketDataProvider;
using optsim::testing::RecordingSink;
using optsim::testing::ScriptedStrategy;

class BacktestCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::ERR;
        logger_config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(logger_config);

        // Tuesday 2024-01-02 to Friday 2024-01-05
        days = {core::make_date(2024, 1, 2), core::make_date(2024, 1, 3),
                core::make_date(2024, 1, 4), core::make_date(2024, 1, 5)};

        config.symbols = {"SPY"};
        config.start_date = days.front();
        config.end_date = days.back();
        config.initial_capital = 100000.0;
        config.max_positions = 5;
        config.position_size_pct = 0.02;
        config.commission_per_contract = 0.65;
        config.slippage_pct = 0.01;
        config.parallel_fetch = false;

        provider = std::make_shared<MockMarketDataProvider>();
        reporter = std::make_shared<ErrorReporter>();
        strategy = std::make_shared<ScriptedStrategy>();
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }

    // Quote the same contract on every day with the given prices
    OptionQuote quote_path(const std::string& symbol, double strike, const Timestamp& expiration,
                           const std::vector<double>& prices) {
        for (size_t i = 0; i < prices.size() && i < days.size(); ++i) {
            chains[{symbol, days[i]}].push_back(
                make_quote(symbol, OptionType::CALL, strike, expiration, prices[i]));
        }
        return make_quote(symbol, OptionType::CALL, strike, expiration, prices.front());
    }

    void publish_chains() {
        for (const auto& [key, quotes] : chains) {
            provider->set_chain(key.first, key.second, quotes);
        }
    }

    std::unique_ptr<BacktestCoordinator> make_coordinator(
        std::vector<std::shared_ptr<ResultsSink>> sinks = {}) {
        return std::make_unique<BacktestCoordinator>(provider, std::move(sinks), reporter);
    }

    std::vector<Timestamp> days;
    BacktestConfig config;
    std::shared_ptr<MockMarketDataProvider> provider;
    std::shared_ptr<ErrorReporter> reporter;
    std::shared_ptr<ScriptedStrategy> strategy;
    std::map<std::pair<std::string, Timestamp>, std::vector<OptionQuote>> chains;
};

TEST_F(BacktestCoordinatorTest, RequiresProvider) {
    EXPECT_THROW(BacktestCoordinator(nullptr), std::invalid_argument);
}

TEST_F(BacktestCoordinatorTest, RejectsInvalidConfig) {
    auto coordinator = make_coordinator();

    BacktestConfig bad = config;
    bad.symbols.clear();
    auto result = coordinator->run(bad, strategy);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    bad = config;
    bad.start_date = core::add_days(config.end_date, 1);
    EXPECT_TRUE(coordinator->run(bad, strategy).is_error());

    EXPECT_TRUE(coordinator->run(config, nullptr).is_error());
    EXPECT_EQ(provider->calls(), 0);
}

TEST_F(BacktestCoordinatorTest, EmptyRunKeepsCapital) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestRun& run = result.value();
    EXPECT_EQ(run.status, RunStatus::COMPLETED);
    EXPECT_EQ(run.strategy_id, "SCRIPTED");
    EXPECT_DOUBLE_EQ(run.final_capital, 100000.0);
    ASSERT_EQ(run.equity_curve.size(), days.size());
    for (size_t i = 0; i < days.size(); ++i) {
        EXPECT_EQ(run.equity_curve[i].date, days[i]);
        EXPECT_DOUBLE_EQ(run.equity_curve[i].total_equity, 100000.0);
    }
    EXPECT_TRUE(run.trades.empty());
    EXPECT_DOUBLE_EQ(run.metrics.max_drawdown_pct, 0.0);
    EXPECT_EQ(strategy->signal_dates, days);
}

TEST_F(BacktestCoordinatorTest, ExpiredPositionClosesWithExpirationReason) {
    Timestamp expiry = days[2];
    OptionQuote quote = quote_path("SPY", 480.0, expiry, {2.0, 2.5, 1.0});
    publish_chains();
    strategy->add_signal(days[0], make_signal(quote));

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestRun& run = result.value();
    ASSERT_EQ(run.trades.size(), 1u);
    const ClosedTrade& trade = run.trades[0];
    EXPECT_EQ(trade.exit_reason, "expiration");
    EXPECT_EQ(trade.exit_date, expiry);
    EXPECT_NEAR(trade.exit_price, 0.99, 1e-12);
    EXPECT_EQ(trade.contracts, 10);
    EXPECT_LT(trade.profit_loss, 0.0);
    EXPECT_NEAR(run.final_capital, 100000.0 + trade.profit_loss, 1e-6);
}

TEST_F(BacktestCoordinatorTest, ExitsFreeCapacityForSameDayEntries) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote first = quote_path("SPY", 480.0, expiry, {2.0, 3.0, 3.0, 3.0});
    OptionQuote second = quote_path("SPY", 490.0, expiry, {1.0, 1.0, 1.2, 1.5});
    publish_chains();

    config.max_positions = 1;
    strategy->add_signal(days[0], make_signal(first));
    strategy->exit_on(1, days[1], "profit_target");
    strategy->add_signal(days[1], make_signal(second));

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestRun& run = result.value();
    ASSERT_EQ(run.trades.size(), 2u);
    EXPECT_EQ(run.trades[0].position_id, 1u);
    EXPECT_EQ(run.trades[0].exit_reason, "profit_target");
    EXPECT_EQ(run.trades[0].exit_date, days[1]);
    EXPECT_EQ(run.trades[1].position_id, 2u);
    EXPECT_EQ(run.trades[1].entry_date, days[1]);
    EXPECT_EQ(run.trades[1].exit_reason, "end_of_backtest");
    EXPECT_EQ(run.trades[1].exit_date, days.back());
    EXPECT_NEAR(run.trades[1].exit_price, 1.5 * 0.99, 1e-12);
}

TEST_F(BacktestCoordinatorTest, MaxPositionsCapsEntries) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    std::vector<Signal> signals;
    for (double strike : {470.0, 480.0, 490.0}) {
        signals.push_back(make_signal(quote_path("SPY", strike, expiry, {2.0, 2.0, 2.0, 2.0})));
    }
    publish_chains();

    config.max_positions = 2;
    for (const auto& signal : signals) {
        strategy->add_signal(days[0], signal);
    }
    strategy->add_signal(days[1], signals[2]);

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());

    const BacktestRun& run = result.value();
    ASSERT_EQ(run.trades.size(), 2u);
    EXPECT_DOUBLE_EQ(run.trades[0].strike, 470.0);
    EXPECT_DOUBLE_EQ(run.trades[1].strike, 480.0);
    // At capacity the strategy is not asked for signals
    ASSERT_EQ(strategy->signal_dates.size(), 1u);
    EXPECT_EQ(strategy->signal_dates[0], days[0]);
}

TEST_F(BacktestCoordinatorTest, UnaffordableSignalsAreReported) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote pricey = quote_path("SPY", 300.0, expiry, {50.0, 50.0, 50.0, 50.0});
    publish_chains();
    strategy->add_signal(days[0], make_signal(pricey));

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().trades.empty());
    EXPECT_EQ(reporter->count(BacktestErrorKind::INSUFFICIENT_CAPITAL), 1u);
}

TEST_F(BacktestCoordinatorTest, MissingSymbolDataIsSkipped) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();
    config.symbols = {"SPY", "QQQ", "IWM"};
    provider->fail_symbol("IWM");

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().equity_curve.size(), days.size());

    // QQQ has an empty chain and IWM errors, every day
    EXPECT_EQ(reporter->count(BacktestErrorKind::DATA_UNAVAILABLE), 2 * days.size());
    EXPECT_EQ(reporter->count(BacktestErrorKind::ORCHESTRATION_FAILURE), 0u);
}

TEST_F(BacktestCoordinatorTest, UnquotedPositionUsesLastPriceAtEnd) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote quote = quote_path("SPY", 480.0, expiry, {2.0, 2.4});
    quote_path("SPY", 500.0, expiry, {1.0, 1.0, 1.0, 1.0});
    publish_chains();
    strategy->add_signal(days[0], make_signal(quote));

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());

    ASSERT_EQ(result.value().trades.size(), 1u);
    const ClosedTrade& trade = result.value().trades[0];
    EXPECT_EQ(trade.exit_reason, "end_of_backtest");
    EXPECT_NEAR(trade.exit_price, 2.4 * 0.99, 1e-12);
    // Days 3 and 4 carry it forward, the final close reports once more
    EXPECT_EQ(reporter->count(BacktestErrorKind::MISSING_MARKET_QUOTE), 3u);
}

TEST_F(BacktestCoordinatorTest, WeekendEndDateClosesOnLastTradingDay) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote quote = quote_path("SPY", 480.0, expiry, {2.0, 2.0, 2.0, 2.5});
    publish_chains();
    strategy->add_signal(days[0], make_signal(quote));

    // Sunday after the last quoted Friday
    config.end_date = core::make_date(2024, 1, 7);

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestRun& run = result.value();
    ASSERT_EQ(run.equity_curve.size(), days.size());
    ASSERT_EQ(run.trades.size(), 1u);
    EXPECT_EQ(run.trades[0].exit_reason, "end_of_backtest");
    EXPECT_EQ(run.trades[0].exit_date, days.back());
    EXPECT_NE(run.trades[0].exit_date, config.end_date);
    EXPECT_EQ(run.trades[0].holding_days(), 3);
    EXPECT_EQ(run.equity_curve.back().date, days.back());
}

TEST_F(BacktestCoordinatorTest, StrategyFailureAbortsWithPartialRun) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote quote = quote_path("SPY", 480.0, expiry, {2.0, 2.0, 2.0, 2.0});
    publish_chains();
    strategy->add_signal(days[0], make_signal(quote));
    strategy->fail_signals_on(days[2]);

    auto sink = std::make_shared<RecordingSink>();
    auto coordinator = make_coordinator({sink});
    auto result = coordinator->run(config, strategy);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::STRATEGY_ERROR);
    EXPECT_TRUE(sink->runs.empty());

    ASSERT_TRUE(coordinator->last_run().has_value());
    const BacktestRun& partial = *coordinator->last_run();
    EXPECT_EQ(partial.status, RunStatus::FAILED);
    ASSERT_TRUE(partial.failure_message.has_value());
    EXPECT_EQ(partial.equity_curve.size(), 2u);
    EXPECT_EQ(reporter->count(BacktestErrorKind::ORCHESTRATION_FAILURE), 1u);
}

TEST_F(BacktestCoordinatorTest, StrategyExceptionAbortsRun) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();
    strategy->throw_on(days[1]);

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::ORCHESTRATION_ERROR);
    ASSERT_TRUE(coordinator->last_run().has_value());
    EXPECT_EQ(coordinator->last_run()->status, RunStatus::FAILED);
    EXPECT_EQ(coordinator->last_run()->equity_curve.size(), 1u);
}

TEST_F(BacktestCoordinatorTest, StrategySeesHistoryUpToEachDay) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    EXPECT_EQ(strategy->history_dates, days);
}

TEST_F(BacktestCoordinatorTest, StrategyInitializeFailureAbortsRun) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();
    strategy->fail_initialize();

    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
    EXPECT_TRUE(strategy->signal_dates.empty());
    EXPECT_EQ(provider->calls(), 0);
    ASSERT_TRUE(coordinator->last_run().has_value());
    EXPECT_EQ(coordinator->last_run()->status, RunStatus::FAILED);
}

TEST_F(BacktestCoordinatorTest, SinksReceiveRunAndTrades) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote quote = quote_path("SPY", 480.0, expiry, {2.0, 3.0, 3.0, 3.0});
    publish_chains();
    strategy->add_signal(days[0], make_signal(quote));
    strategy->exit_on(1, days[1], "profit_target");

    auto first = std::make_shared<RecordingSink>("RUN_A");
    auto second = std::make_shared<RecordingSink>("RUN_B");
    auto coordinator = make_coordinator({first, second});
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().run_id, "RUN_A");
    ASSERT_EQ(first->runs.size(), 1u);
    ASSERT_EQ(second->runs.size(), 1u);
    EXPECT_EQ(second->runs[0].run_id, "RUN_A");

    ASSERT_EQ(first->trades.size(), 1u);
    EXPECT_EQ(first->trades[0].first, "RUN_A");
    EXPECT_EQ(first->trades[0].second.exit_reason, "profit_target");
    ASSERT_EQ(second->trades.size(), 1u);
    EXPECT_EQ(second->trades[0].first, "RUN_B");

    ASSERT_TRUE(coordinator->last_run().has_value());
    EXPECT_EQ(coordinator->last_run()->run_id, "RUN_A");
}

TEST_F(BacktestCoordinatorTest, SinkFailureIsNotFatal) {
    quote_path("SPY", 480.0, core::make_date(2024, 2, 16), {2.0, 2.0, 2.0, 2.0});
    publish_chains();

    auto broken = std::make_shared<RecordingSink>("BROKEN");
    broken->fail_persist = true;
    auto healthy = std::make_shared<RecordingSink>("HEALTHY");
    auto coordinator = make_coordinator({broken, healthy});

    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, RunStatus::COMPLETED);
    EXPECT_EQ(result.value().run_id, "HEALTHY");
    EXPECT_EQ(healthy->runs.size(), 1u);
    EXPECT_EQ(reporter->count(BacktestErrorKind::ORCHESTRATION_FAILURE), 1u);
}

TEST_F(BacktestCoordinatorTest, CapitalConservedAcrossRun) {
    Timestamp expiry = core::make_date(2024, 2, 16);
    OptionQuote a = quote_path("SPY", 470.0, expiry, {2.0, 2.6, 1.7, 2.2});
    OptionQuote b = quote_path("SPY", 480.0, expiry, {1.5, 1.1, 1.9, 2.4});
    OptionQuote c = quote_path("SPY", 490.0, expiry, {0.8, 0.9, 0.5, 0.7});
    publish_chains();

    strategy->add_signal(days[0], make_signal(a));
    strategy->add_signal(days[0], make_signal(b));
    strategy->exit_on(1, days[1], "profit_target");
    strategy->add_signal(days[2], make_signal(c));
    strategy->exit_on(2, days[2], "stop_loss");

    config.parallel_fetch = true;
    auto coordinator = make_coordinator();
    auto result = coordinator->run(config, strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestRun& run = result.value();
    ASSERT_EQ(run.trades.size(), 3u);
    double realized = std::accumulate(
        run.trades.begin(), run.trades.end(), 0.0,
        [](double sum, const ClosedTrade& t) { return sum + t.profit_loss; });
    EXPECT_NEAR(run.final_capital, run.initial_capital + realized, 1e-6);
    EXPECT_EQ(run.metrics.total_trades, 3);
    ASSERT_NE(coordinator->ledger(), nullptr);
    EXPECT_EQ(coordinator->ledger()->open_position_count(), 0u);
}

TEST_F(BacktestCoordinatorTest, ProcessDayRequiresRun) {
    auto coordinator = make_coordinator();
    MarketSnapshot snapshot;
    auto result = coordinator->process_day(days[0], snapshot, *strategy, config);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
}
