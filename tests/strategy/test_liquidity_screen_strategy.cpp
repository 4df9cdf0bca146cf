#include <gtest/gtest.h>
#include <memory>
#include "../backtesting/mock_components.hpp"
#include "optsim/core/time_utils.hpp"
#include "optsim/strategy/liquidity_screen_strategy.hpp"

using namespace optsim;
using optsim::testing::make_quote;
using optsim::testing::make_snapshot;

class LiquidityScreenStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        date = core::make_date(2024, 1, 2);
        expiry = core::make_date(2024, 2, 16);
        config.min_volume = 100;
        config.min_open_interest = 500;
        config.min_implied_volatility = 0.70;
        config.max_signals_per_day = 5;
        strategy = std::make_unique<LiquidityScreenStrategy>("LIQ", config);
    }

    OptionQuote with_iv(OptionQuote quote, double iv) {
        Greeks greeks;
        greeks.implied_volatility = iv;
        quote.greeks = greeks;
        return quote;
    }

    backtest::Position position_at(Price entry_price) {
        backtest::Position position;
        position.position_id = 1;
        position.symbol = "SPY";
        position.strike = 480.0;
        position.expiration = expiry;
        position.entry_price = entry_price;
        position.contracts = 1;
        return position;
    }

    Timestamp date;
    Timestamp expiry;
    LiquidityScreenConfig config;
    std::unique_ptr<LiquidityScreenStrategy> strategy;
};

TEST_F(LiquidityScreenStrategyTest, ScreensIlliquidContracts) {
    auto liquid = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.0, 1000, 5000);
    auto thin_volume = make_quote("SPY", OptionType::CALL, 485.0, expiry, 2.0, 50, 5000);
    auto thin_oi = make_quote("SPY", OptionType::CALL, 490.0, expiry, 2.0, 1000, 100);
    auto no_price = make_quote("SPY", OptionType::CALL, 495.0, expiry, 0.0, 1000, 5000);
    auto low_iv = with_iv(make_quote("SPY", OptionType::PUT, 470.0, expiry, 2.0), 0.35);
    auto expiring = make_quote("SPY", OptionType::PUT, 465.0, date, 2.0);

    auto result = strategy->generate_signals(
        make_snapshot(date, {liquid, thin_volume, thin_oi, no_price, low_iv, expiring}), date);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);

    const Signal& signal = result.value()[0];
    EXPECT_EQ(signal.symbol, "SPY");
    EXPECT_DOUBLE_EQ(signal.strike, 480.0);
    EXPECT_EQ(signal.expiration, expiry);
    EXPECT_DOUBLE_EQ(signal.price, 2.0);
}

TEST_F(LiquidityScreenStrategyTest, QuotesWithoutGreeksSkipVolatilityScreen) {
    auto high_iv = with_iv(make_quote("QQQ", OptionType::CALL, 400.0, expiry, 1.0), 0.95);
    auto no_greeks = make_quote("QQQ", OptionType::CALL, 405.0, expiry, 1.0);
    auto result = strategy->generate_signals(make_snapshot(date, {high_iv, no_greeks}), date);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 2u);
}

TEST_F(LiquidityScreenStrategyTest, RanksByNotionalAndCaps) {
    config.max_signals_per_day = 2;
    LiquidityScreenStrategy capped("LIQ", config);

    auto small = make_quote("SPY", OptionType::CALL, 480.0, expiry, 1.0, 200);
    auto large = make_quote("QQQ", OptionType::CALL, 400.0, expiry, 4.0, 5000);
    auto medium = make_quote("IWM", OptionType::PUT, 190.0, expiry, 2.0, 1000);

    auto result = capped.generate_signals(make_snapshot(date, {small, large, medium}), date);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].symbol, "QQQ");
    EXPECT_EQ(result.value()[1].symbol, "IWM");
}

TEST_F(LiquidityScreenStrategyTest, TiesAreOrderedDeterministically) {
    auto a = make_quote("SPY", OptionType::CALL, 490.0, expiry, 2.0);
    auto b = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.0);
    auto c = make_quote("QQQ", OptionType::CALL, 400.0, expiry, 2.0);

    auto result = strategy->generate_signals(make_snapshot(date, {a, b, c}), date);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].symbol, "QQQ");
    EXPECT_DOUBLE_EQ(result.value()[1].strike, 480.0);
    EXPECT_DOUBLE_EQ(result.value()[2].strike, 490.0);
}

TEST_F(LiquidityScreenStrategyTest, EmptySnapshotGivesNoSignals) {
    auto result = strategy->generate_signals(make_snapshot(date, {}), date);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(LiquidityScreenStrategyTest, TrendFilterFollowsUnderlying) {
    // Quotes carry an underlying price of 100
    auto provider = std::make_shared<optsim::testing::MockMarketDataProvider>();
    provider->set_history("SPY", {{core::add_days(date, -2), 94.0},
                                  {core::add_days(date, -1), 96.0}});
    provider->set_history("QQQ", {{core::add_days(date, -2), 104.0},
                                  {core::add_days(date, -1), 106.0}});
    auto history = std::make_shared<PriceHistory>(provider);
    history->set_as_of(date);

    config.trend_lookback_days = 5;
    LiquidityScreenStrategy trending("LIQ", config);
    ASSERT_TRUE(trending.initialize(history).is_ok());

    auto spy_call = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.0);
    auto spy_put = make_quote("SPY", OptionType::PUT, 470.0, expiry, 2.0);
    auto qqq_call = make_quote("QQQ", OptionType::CALL, 400.0, expiry, 2.0);
    auto qqq_put = make_quote("QQQ", OptionType::PUT, 390.0, expiry, 2.0);
    auto iwm_call = make_quote("IWM", OptionType::CALL, 190.0, expiry, 2.0);

    auto result = trending.generate_signals(
        make_snapshot(date, {spy_call, spy_put, qqq_call, qqq_put, iwm_call}), date);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 2u);

    // Uptrend keeps SPY calls, downtrend keeps QQQ puts, IWM has no history
    EXPECT_EQ(result.value()[0].symbol, "QQQ");
    EXPECT_EQ(result.value()[0].option_type, OptionType::PUT);
    EXPECT_EQ(result.value()[1].symbol, "SPY");
    EXPECT_EQ(result.value()[1].option_type, OptionType::CALL);
}

TEST_F(LiquidityScreenStrategyTest, TrendFilterNeedsHistory) {
    config.trend_lookback_days = 5;
    LiquidityScreenStrategy trending("LIQ", config);

    auto before_init = trending.generate_signals(make_snapshot(date, {}), date);
    ASSERT_TRUE(before_init.is_error());
    EXPECT_EQ(before_init.error()->code(), ErrorCode::NOT_INITIALIZED);

    auto init = trending.initialize(nullptr);
    ASSERT_TRUE(init.is_error());
    EXPECT_EQ(init.error()->code(), ErrorCode::NOT_INITIALIZED);

    // Without the filter a missing history is fine
    EXPECT_TRUE(strategy->initialize(nullptr).is_ok());
}

TEST_F(LiquidityScreenStrategyTest, ExitOnProfitTarget) {
    auto quote = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.50);
    auto result = strategy->check_exit_criteria(position_at(2.0), quote, date);
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "profit_target");
}

TEST_F(LiquidityScreenStrategyTest, ExitOnStopLoss) {
    auto quote = make_quote("SPY", OptionType::CALL, 480.0, expiry, 1.60);
    auto result = strategy->check_exit_criteria(position_at(2.0), quote, date);
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "stop_loss");
}

TEST_F(LiquidityScreenStrategyTest, HoldsInsideBand) {
    auto quote = make_quote("SPY", OptionType::CALL, 480.0, expiry, 2.10);
    auto result = strategy->check_exit_criteria(position_at(2.0), quote, date);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_value());

    auto unpriced = make_quote("SPY", OptionType::CALL, 480.0, expiry, 0.0);
    auto no_mark = strategy->check_exit_criteria(position_at(2.0), unpriced, date);
    ASSERT_TRUE(no_mark.is_ok());
    EXPECT_FALSE(no_mark.value().has_value());
}

TEST_F(LiquidityScreenStrategyTest, ConfigValidationAndJson) {
    EXPECT_TRUE(config.validate().is_ok());

    LiquidityScreenConfig bad = config;
    bad.stop_loss_pct = 5.0;
    EXPECT_TRUE(bad.validate().is_error());

    bad = config;
    bad.max_signals_per_day = 0;
    EXPECT_TRUE(bad.validate().is_error());

    bad = config;
    bad.trend_lookback_days = -1;
    EXPECT_TRUE(bad.validate().is_error());

    LiquidityScreenConfig loaded;
    loaded.from_json({{"min_volume", 250}, {"profit_target_pct", 35.0}});
    EXPECT_EQ(loaded.min_volume, 250);
    EXPECT_DOUBLE_EQ(loaded.profit_target_pct, 35.0);
    EXPECT_EQ(loaded.min_open_interest, 500);
    EXPECT_EQ(loaded.to_json().at("stop_loss_pct").get<double>(), -15.0);
    EXPECT_EQ(loaded.trend_lookback_days, 0);
}
