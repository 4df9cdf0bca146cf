// include/optsim/strategy/liquidity_screen_strategy.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "optsim/core/config_base.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"
#include "optsim/strategy/strategy_interface.hpp"

namespace optsim {

/**
 * @brief Configuration for the liquidity screen strategy
 */
struct LiquidityScreenConfig : public ConfigBase {
    int64_t min_volume{100};              // Minimum contracts traded on the day
    int64_t min_open_interest{500};       // Minimum outstanding contracts
    double min_implied_volatility{0.70};  // Applied only when greeks are quoted
    double min_notional_value{0.0};       // mark * volume * 100
    int min_days_to_expiration{1};
    int max_signals_per_day{5};
    double profit_target_pct{20.0};  // Move from entry fill, in percent
    double stop_loss_pct{-15.0};     // Negative, in percent
    int trend_lookback_days{0};      // 0 disables the underlying trend filter

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check ranges (counts non-negative, stop below target)
     */
    Result<void> validate() const override;
};

/**
 * @brief Reference strategy: buys the most actively traded liquid contracts
 *
 * Entry: every quote passing the volume, open interest, implied volatility,
 * notional and time-to-expiration screens with a positive mark, ranked by
 * notional value (descending), at most max_signals_per_day per day.
 * Exit: the mark has moved at least profit_target_pct above the entry fill
 * ("profit_target") or at most stop_loss_pct below it ("stop_loss").
 *
 * With trend_lookback_days > 0, calls are only taken while the underlying
 * trades at or above its average close over the lookback and puts only while
 * it trades below. A symbol without history produces no signals that day.
 */
class LiquidityScreenStrategy : public OptionsStrategy {
public:
    LiquidityScreenStrategy(std::string id, LiquidityScreenConfig config);

    std::string get_id() const override {
        return id_;
    }

    Result<void> initialize(std::shared_ptr<const PriceHistory> history) override;

    Result<std::vector<Signal>> generate_signals(const MarketSnapshot& snapshot,
                                                 const Timestamp& date) override;

    Result<std::optional<std::string>> check_exit_criteria(const backtest::Position& position,
                                                           const OptionQuote& quote,
                                                           const Timestamp& date) override;

    const LiquidityScreenConfig& config() const {
        return config_;
    }

private:
    bool passes_screen(const OptionQuote& quote, const Timestamp& date) const;

    /**
     * @brief Whether the underlying is in an uptrend, per symbol in the snapshot
     *
     * Symbols whose history could not be read are left out.
     */
    std::map<std::string, bool> underlying_trends(const MarketSnapshot& snapshot) const;

    std::string id_;
    LiquidityScreenConfig config_;
    std::shared_ptr<const PriceHistory> history_;
};

}  // namespace optsim
